#ifndef UCOP_COMMON_UTILS_TEMPLATE_RENDERER_H
#define UCOP_COMMON_UTILS_TEMPLATE_RENDERER_H

#include "core/types/context.h"
#include <inja/inja.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace ucop {

class InjaTemplateRenderer {
public:
    InjaTemplateRenderer();

    // Renders with a per-thread default environment. Throws std::runtime_error.
    static std::string render(std::string_view template_str, const Context& context);

    // Renders every string leaf of a step's inputs against the context view.
    // A leaf that is exactly "{{ a.b.c }}" resolves to the referenced value
    // with its JSON type intact instead of its text form.
    static Value render_inputs(const Value& inputs, const Context& context);

    std::string render_with_env(std::string_view template_str, const Context& context);

private:
    inja::Environment env_;
    void configure_security();

    static std::optional<std::string> single_path_expression(std::string_view template_str);
    static const Value* lookup_path(const Context& context, const std::string& path);
};

} // namespace ucop

#endif // UCOP_COMMON_UTILS_TEMPLATE_RENDERER_H
