#include "common/steps/step_registry.h"
#include <algorithm>
#include <stdexcept>

namespace ucop {

void StepRegistry::register_step(std::string ref, StepFactory factory) {
    if (ref.empty()) {
        throw std::invalid_argument("Step ref must not be empty");
    }
    if (!factory) {
        throw std::invalid_argument("Step factory for '" + ref + "' is empty");
    }
    factories_[std::move(ref)] = std::move(factory);
}

void StepRegistry::register_capability(const std::string& capability, std::string ref) {
    auto& candidates = capabilities_[capability];
    if (std::find(candidates.begin(), candidates.end(), ref) == candidates.end()) {
        candidates.push_back(std::move(ref));
    }
}

bool StepRegistry::has_step(const std::string& ref) const {
    return factories_.find(ref) != factories_.end();
}

std::unique_ptr<Step> StepRegistry::create(const std::string& ref) const {
    auto it = factories_.find(ref);
    if (it == factories_.end()) {
        throw std::out_of_range("Step not registered: " + ref);
    }
    auto step = it->second();
    if (!step) {
        throw std::runtime_error("Step factory for '" + ref + "' returned no instance");
    }
    return step;
}

std::optional<std::string> StepRegistry::resolve_capability(const std::string& capability) const {
    auto it = capabilities_.find(capability);
    if (it == capabilities_.end()) {
        return std::nullopt;
    }
    for (const auto& ref : it->second) {
        if (has_step(ref)) {
            return ref;
        }
    }
    return std::nullopt;
}

std::vector<std::string> StepRegistry::list_steps() const {
    std::vector<std::string> refs;
    refs.reserve(factories_.size());
    for (const auto& [ref, _] : factories_) {
        refs.push_back(ref);
    }
    std::sort(refs.begin(), refs.end());
    return refs;
}

} // namespace ucop
