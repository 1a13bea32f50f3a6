// modules/context/context_engine.cpp
#include "modules/context/context_engine.h"
#include <algorithm>
#include <stdexcept>

namespace ucop {

namespace {

bool is_known_strategy(const MergeStrategy& s) {
    return s == "error_on_conflict" || s == "last_write_wins" || s == "deep_merge" ||
           s == "array_concat" || s == "array_merge_unique";
}

MergeStrategy checked_strategy(const nlohmann::json& v) {
    if (!v.is_string() || !is_known_strategy(v.get<std::string>())) {
        throw std::invalid_argument("Unknown merge strategy: " + v.dump());
    }
    return v.get<std::string>();
}

// Exact path first, then the longest matching "prefix.*" pattern
MergeStrategy strategy_for_path(const std::string& path, const ContextMergePolicy& policy) {
    auto exact = policy.field_policies.find(path);
    if (exact != policy.field_policies.end()) {
        return exact->second;
    }

    const MergeStrategy* best = nullptr;
    size_t best_len = 0;
    for (const auto& [pattern, strategy] : policy.field_policies) {
        if (pattern.empty() || pattern.back() != '*') continue;
        std::string prefix = pattern.substr(0, pattern.size() - 1);
        if (path.starts_with(prefix) && (best == nullptr || prefix.size() > best_len)) {
            best = &strategy;
            best_len = prefix.size();
        }
    }
    return best ? *best : policy.default_strategy;
}

} // namespace

ContextMergePolicy ContextMergePolicy::from_json(const nlohmann::json& j) {
    ContextMergePolicy policy;
    if (j.is_null()) {
        return policy;
    }
    if (j.is_string()) {
        policy.default_strategy = checked_strategy(j);
        return policy;
    }
    if (!j.is_object()) {
        throw std::invalid_argument("Merge policy must be a strategy name or an object");
    }
    if (j.contains("default")) {
        policy.default_strategy = checked_strategy(j["default"]);
    }
    if (j.contains("fields")) {
        if (!j["fields"].is_object()) {
            throw std::invalid_argument("Merge policy 'fields' must be an object");
        }
        for (auto it = j["fields"].begin(); it != j["fields"].end(); ++it) {
            policy.field_policies[it.key()] = checked_strategy(it.value());
        }
    }
    return policy;
}

ContextEngine::ContextEngine(ContextMergePolicy policy)
    : policy_(std::move(policy)) {}

Context ContextEngine::build_view(const JobId& job_id,
                                  const Context& inputs,
                                  const std::map<StepId, Value>& outputs,
                                  const CompiledGraph& graph) const {
    Context view = Context::object();
    view["job_id"] = job_id;
    view["inputs"] = inputs.is_null() ? Context::object() : inputs;

    Context outputs_json = Context::object();
    for (const auto& [step_id, output] : outputs) {
        outputs_json[step_id] = output;
    }
    view["outputs"] = std::move(outputs_json);

    Context state = Context::object();
    for (const auto& level : graph.levels) {
        for (const auto& step_id : level) {
            auto it = outputs.find(step_id);
            if (it != outputs.end() && it->second.is_object()) {
                merge(state, it->second, policy_);
            }
        }
    }
    view["state"] = std::move(state);
    return view;
}

void ContextEngine::fill_missing_dependencies(Context& view, const CompiledGraph& graph, const std::vector<StepId>& step_ids) {
    auto& outputs = view["outputs"];
    for (const auto& id : step_ids) {
        for (const auto& dep : graph.step(id).dependencies) {
            if (!outputs.contains(dep)) {
                outputs[dep] = nullptr;
            }
        }
    }
}

void ContextEngine::merge(Context& target, const Context& source, const ContextMergePolicy& policy) {
    if (!source.is_object()) {
        return;
    }
    if (target.is_null()) {
        target = Context::object();
    }
    merge_recursive(target, source, "", policy);
}

void ContextEngine::merge_recursive(Context& target, const Context& source, const std::string& path_prefix, const ContextMergePolicy& policy) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string current_path = path_prefix.empty() ? it.key() : path_prefix + "." + it.key();

        auto target_it = target.find(it.key());
        if (target_it == target.end()) {
            target[it.key()] = it.value();
            continue;
        }

        MergeStrategy strategy = strategy_for_path(current_path, policy);
        if (target_it.value().is_object() && it.value().is_object() && strategy != "last_write_wins") {
            merge_recursive(target_it.value(), it.value(), current_path, policy);
        } else if (target_it.value().is_array() && it.value().is_array()) {
            merge_array(target_it.value(), it.value(), strategy, current_path);
        } else {
            merge_scalar(target_it.value(), it.value(), strategy, current_path);
        }
    }
}

void ContextEngine::merge_array(Context& target_arr, const Context& source_arr, const MergeStrategy& strategy, const std::string& path) {
    if (strategy == "array_concat") {
        for (const auto& item : source_arr) {
            target_arr.push_back(item);
        }
    } else if (strategy == "array_merge_unique") {
        for (const auto& item : source_arr) {
            if (std::find(target_arr.begin(), target_arr.end(), item) == target_arr.end()) {
                target_arr.push_back(item);
            }
        }
    } else if (strategy == "deep_merge" || strategy == "last_write_wins") {
        // arrays are replaced, never spliced element by element
        target_arr = source_arr;
    } else if (target_arr != source_arr) {
        throw std::runtime_error("Context merge conflict for array field '" + path + "'");
    }
}

void ContextEngine::merge_scalar(Context& target_val, const Context& source_val, const MergeStrategy& strategy, const std::string& path) {
    if (strategy == "error_on_conflict") {
        if (target_val != source_val) {
            throw std::runtime_error("Context merge conflict for field '" + path + "': " +
                                     target_val.dump() + " vs " + source_val.dump());
        }
        return;
    }
    // every other strategy lets the later writer win for scalars and mismatched types
    target_val = source_val;
}

} // namespace ucop
