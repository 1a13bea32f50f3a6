// modules/compiler/workflow_compiler.h
#ifndef UCOP_MODULES_COMPILER_WORKFLOW_COMPILER_H
#define UCOP_MODULES_COMPILER_WORKFLOW_COMPILER_H

#include "core/types/workflow.h"
#include "core/types/errors.h"
#include "common/steps/step_registry.h"
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace ucop {

// Turns a WorkflowDefinition into a validated, leveled CompiledGraph.
// Pure: the same definition (and registry contents) always yields the same graph.
class WorkflowCompiler {
public:
    // Without a registry, refs are not checked and capabilities cannot be resolved
    explicit WorkflowCompiler(const StepRegistry* registry = nullptr);

    // Throws CompileError (CycleError for cycles); never returns a partial graph
    CompiledGraph compile(const WorkflowDefinition& definition) const;

private:
    const StepRegistry* registry_;

    void validate_structure(const WorkflowDefinition& definition) const;
    StepSpec resolve_step(const std::string& workflow_id, const StepSpec& spec) const;

    using DependencyMap = std::map<StepId, std::set<StepId>>;

    static std::optional<std::vector<StepId>> find_cycle(const DependencyMap& deps);
    static std::vector<std::vector<StepId>> compute_levels(const DependencyMap& deps);
};

} // namespace ucop

#endif // UCOP_MODULES_COMPILER_WORKFLOW_COMPILER_H
