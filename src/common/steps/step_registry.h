// common/steps/step_registry.h
#ifndef UCOP_COMMON_STEPS_STEP_REGISTRY_H
#define UCOP_COMMON_STEPS_STEP_REGISTRY_H

#include "core/types/step.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ucop {

// Adapts a plain callable to the Step interface
class FunctionStep : public Step {
public:
    explicit FunctionStep(StepFunction func) : func_(std::move(func)) {}

    Value execute(const StepInput& input) override {
        return func_(input);
    }

private:
    StepFunction func_;
};

// Explicit identifier -> factory table, filled at startup and read-only afterwards
class StepRegistry {
public:
    StepRegistry() = default;

    void register_step(std::string ref, StepFactory factory);

    // Registers a concrete Step subclass, default constructed for every attempt
    template<typename StepT>
    void register_step_type(std::string ref) {
        static_assert(std::is_base_of_v<Step, StepT>, "StepT must derive from ucop::Step");
        register_step(std::move(ref), [] { return std::make_unique<StepT>(); });
    }

    // Registers a callable Value(const StepInput&); each attempt gets its own copy
    template<typename Func>
    void register_function(std::string ref, Func&& func) {
        StepFunction fn = std::forward<Func>(func);
        register_step(std::move(ref), [fn] { return std::make_unique<FunctionStep>(fn); });
    }

    // Candidates are tried in registration order at compile time
    void register_capability(const std::string& capability, std::string ref);

    bool has_step(const std::string& ref) const;
    std::unique_ptr<Step> create(const std::string& ref) const;   // throws std::out_of_range
    std::optional<std::string> resolve_capability(const std::string& capability) const;
    std::vector<std::string> list_steps() const;

private:
    std::unordered_map<std::string, StepFactory> factories_;
    std::map<std::string, std::vector<std::string>> capabilities_;
};

} // namespace ucop

#endif // UCOP_COMMON_STEPS_STEP_REGISTRY_H
