#ifndef UCOP_CORE_TYPES_WORKFLOW_H
#define UCOP_CORE_TYPES_WORKFLOW_H

#include "context.h"
#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ucop {

// Upper bound for StepSpec::retries
constexpr int kMaxStepRetries = 1000;

// One named unit of work inside a workflow
struct StepSpec {
    StepId id;
    std::string ref;                                  // registered step identifier
    std::vector<StepId> depends_on;
    std::optional<std::chrono::milliseconds> timeout;
    int retries = 0;                                  // additional attempts after the first
    bool continue_on_error = false;

    nlohmann::json inputs = nlohmann::json::object(); // string leaves are inja templates
    std::optional<std::string> capability;            // resolved to ref when ref is empty
    bool parallel = true;
    std::optional<std::string> mutex_tag;
    nlohmann::json metadata = nlohmann::json::object();

    bool operator==(const StepSpec&) const = default;
};

struct WorkflowDefinition {
    std::string id;
    std::string version = "1.0";
    std::string description;
    std::vector<StepSpec> steps;
    nlohmann::json metadata = nlohmann::json::object();
    nlohmann::json merge_policy;                      // null = deep_merge everywhere

    bool operator==(const WorkflowDefinition&) const = default;
};

struct CompiledStep {
    StepSpec spec;                    // ref already resolved
    std::set<StepId> dependencies;
    std::set<StepId> dependents;
    size_t level = 0;
    bool exclusive = false;           // non-parallel: serialized against its tag or its whole level
};

struct CompiledGraph {
    std::string workflow_id;
    std::string version;
    std::map<StepId, CompiledStep> steps;
    std::vector<std::vector<StepId>> levels;   // each level sorted by step id
    nlohmann::json merge_policy;

    bool has_step(const StepId& id) const {
        return steps.find(id) != steps.end();
    }

    const CompiledStep& step(const StepId& id) const {
        auto it = steps.find(id);
        if (it == steps.end()) {
            throw std::out_of_range("Step '" + id + "' is not part of workflow '" + workflow_id + "'");
        }
        return it->second;
    }

    size_t step_count() const { return steps.size(); }
    size_t level_count() const { return levels.size(); }

    // All steps reachable through dependents edges, excluding id itself
    std::set<StepId> transitive_dependents(const StepId& id) const {
        std::set<StepId> result;
        std::vector<StepId> stack{id};
        while (!stack.empty()) {
            StepId current = stack.back();
            stack.pop_back();
            for (const auto& next : step(current).dependents) {
                if (result.insert(next).second) {
                    stack.push_back(next);
                }
            }
        }
        return result;
    }
};

} // namespace ucop

#endif // UCOP_CORE_TYPES_WORKFLOW_H
