// modules/context/context_engine.h
#ifndef UCOP_MODULES_CONTEXT_CONTEXT_ENGINE_H
#define UCOP_MODULES_CONTEXT_CONTEXT_ENGINE_H

#include "core/types/context.h"
#include "core/types/workflow.h"
#include <nlohmann/json.hpp>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace ucop {

// "error_on_conflict", "last_write_wins", "deep_merge", "array_concat", "array_merge_unique"
using MergeStrategy = std::string;

struct ContextMergePolicy {
    std::unordered_map<std::string, MergeStrategy> field_policies; // exact dotted path or "prefix.*"
    MergeStrategy default_strategy = "deep_merge";

    // Accepts null, a bare strategy name, or {"default": ..., "fields": {path: strategy}}.
    // Throws std::invalid_argument on unknown strategies.
    static ContextMergePolicy from_json(const nlohmann::json& j);
};

// Builds the read-only context view a level's steps see:
//   {"job_id": ..., "inputs": {...}, "outputs": {step: output}, "state": {...}}
// "state" folds every object output into one document, in level order then
// step id order, so the same outputs always give the same view.
class ContextEngine {
public:
    explicit ContextEngine(ContextMergePolicy policy = {});

    Context build_view(const JobId& job_id,
                       const Context& inputs,
                       const std::map<StepId, Value>& outputs,
                       const CompiledGraph& graph) const;

    // Null placeholders for dependencies of `step_ids` that recorded no output
    static void fill_missing_dependencies(Context& view, const CompiledGraph& graph, const std::vector<StepId>& step_ids);

    static void merge(Context& target, const Context& source, const ContextMergePolicy& policy = {});

    const ContextMergePolicy& policy() const { return policy_; }

private:
    ContextMergePolicy policy_;

    static void merge_recursive(Context& target, const Context& source, const std::string& path_prefix, const ContextMergePolicy& policy);
    static void merge_array(Context& target_arr, const Context& source_arr, const MergeStrategy& strategy, const std::string& path);
    static void merge_scalar(Context& target_val, const Context& source_val, const MergeStrategy& strategy, const std::string& path);
};

} // namespace ucop

#endif // UCOP_MODULES_CONTEXT_CONTEXT_ENGINE_H
