// common/utils/template_renderer.cpp
#include "common/utils/template_renderer.h"
#include <inja/inja.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ucop {

InjaTemplateRenderer::InjaTemplateRenderer() : env_() {
    env_.set_expression("{{", "}}");
    env_.set_statement("{%", "%}");
    env_.set_comment("{#", "#}");
    env_.set_line_statement("##");

    configure_security();
}

void InjaTemplateRenderer::configure_security() {
    // Step inputs never read from disk
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled for security.", inja::SourceLocation{});
    });
}

std::string InjaTemplateRenderer::render(std::string_view template_str, const Context& context) {
    // inja::Environment is not safe to share across executor workers
    thread_local InjaTemplateRenderer renderer;
    return renderer.render_with_env(template_str, context);
}

std::string InjaTemplateRenderer::render_with_env(std::string_view template_str, const Context& context) {
    try {
        return env_.render(template_str, context);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Template render error: " + std::string(e.message));
    }
}

Value InjaTemplateRenderer::render_inputs(const Value& inputs, const Context& context) {
    if (inputs.is_string()) {
        const auto& text = inputs.get_ref<const std::string&>();
        if (text.find("{{") == std::string::npos && text.find("{%") == std::string::npos) {
            return inputs;
        }
        if (auto path = single_path_expression(text)) {
            if (const Value* found = lookup_path(context, *path)) {
                return *found;
            }
        }
        return render(text, context);
    }
    if (inputs.is_object()) {
        Value rendered = Value::object();
        for (auto it = inputs.begin(); it != inputs.end(); ++it) {
            rendered[it.key()] = render_inputs(it.value(), context);
        }
        return rendered;
    }
    if (inputs.is_array()) {
        Value rendered = Value::array();
        for (const auto& item : inputs) {
            rendered.push_back(render_inputs(item, context));
        }
        return rendered;
    }
    return inputs;
}

// "{{ outputs.draft.text }}" -> "outputs.draft.text"; anything else -> nullopt
std::optional<std::string> InjaTemplateRenderer::single_path_expression(std::string_view template_str) {
    auto trim = [](std::string_view s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
        return s;
    };

    std::string_view s = trim(template_str);
    if (!s.starts_with("{{") || !s.ends_with("}}") || s.size() < 5) {
        return std::nullopt;
    }
    std::string_view expr = trim(s.substr(2, s.size() - 4));
    if (expr.empty() || expr.find("{{") != std::string_view::npos || expr.find("}}") != std::string_view::npos) {
        return std::nullopt;
    }
    for (char c : expr) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '.' && c != '-') {
            return std::nullopt;
        }
    }
    if (expr.front() == '.' || expr.back() == '.') {
        return std::nullopt;
    }
    return std::string(expr);
}

const Value* InjaTemplateRenderer::lookup_path(const Context& context, const std::string& path) {
    const Value* current = &context;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (key.empty()) return nullptr;

        if (current->is_object()) {
            auto it = current->find(key);
            if (it == current->end()) return nullptr;
            current = &(*it);
        } else if (current->is_array() && std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isdigit(c); })) {
            size_t index = std::stoul(key);
            if (index >= current->size()) return nullptr;
            current = &(*current)[index];
        } else {
            return nullptr;
        }

        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return current;
}

} // namespace ucop
