// modules/compiler/workflow_compiler.cpp
#include "modules/compiler/workflow_compiler.h"
#include "modules/context/context_engine.h"
#include "common/utils/logging.h"
#include <algorithm>
#include <functional>
#include <stdexcept>
#include <unordered_map>

namespace ucop {

WorkflowCompiler::WorkflowCompiler(const StepRegistry* registry)
    : registry_(registry) {}

CompiledGraph WorkflowCompiler::compile(const WorkflowDefinition& definition) const {
    validate_structure(definition);

    // 1. Dependency map (step -> what it waits for)
    DependencyMap deps;
    for (const auto& spec : definition.steps) {
        deps[spec.id] = std::set<StepId>(spec.depends_on.begin(), spec.depends_on.end());
    }

    // 2. Cycles, including self-dependencies
    if (auto cycle = find_cycle(deps)) {
        throw CycleError(definition.id, std::move(*cycle));
    }

    // 3. Refs and capabilities
    CompiledGraph graph;
    graph.workflow_id = definition.id;
    graph.version = definition.version;
    graph.merge_policy = definition.merge_policy;

    for (const auto& spec : definition.steps) {
        CompiledStep step;
        step.spec = resolve_step(definition.id, spec);
        step.dependencies = deps[spec.id];
        // a tag without an explicit parallel flag still means "run alone"
        step.exclusive = !step.spec.parallel || step.spec.mutex_tag.has_value();
        graph.steps.emplace(spec.id, std::move(step));
    }

    // 4. Reverse edges
    for (const auto& [id, dependencies] : deps) {
        for (const auto& dep : dependencies) {
            graph.steps.at(dep).dependents.insert(id);
        }
    }

    // 5. Levels
    graph.levels = compute_levels(deps);
    for (size_t level = 0; level < graph.levels.size(); ++level) {
        for (const auto& id : graph.levels[level]) {
            graph.steps.at(id).level = level;
        }
    }

    log_debug("compiler", "Compiled workflow '" + definition.id + "' v" + definition.version + ": " +
                              std::to_string(graph.step_count()) + " steps in " +
                              std::to_string(graph.level_count()) + " levels");
    return graph;
}

void WorkflowCompiler::validate_structure(const WorkflowDefinition& definition) const {
    if (definition.id.empty()) {
        throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id, "workflow id must not be empty");
    }
    if (definition.version.empty()) {
        throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id, "workflow version must not be empty");
    }
    if (definition.steps.empty()) {
        throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id, "workflow has no steps");
    }

    try {
        ContextMergePolicy::from_json(definition.merge_policy);
    } catch (const std::invalid_argument& e) {
        throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id, e.what());
    }

    std::set<StepId> seen;
    for (const auto& spec : definition.steps) {
        if (spec.id.empty()) {
            throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id, "step id must not be empty");
        }
        if (!seen.insert(spec.id).second) {
            throw CompileError(CompileErrorKind::DUPLICATE_STEP, definition.id, "duplicate step id '" + spec.id + "'");
        }
        if (spec.retries < 0) {
            throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id,
                               "step '" + spec.id + "' has negative retries");
        }
        if (spec.retries > kMaxStepRetries) {
            throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id,
                               "step '" + spec.id + "' has more than " + std::to_string(kMaxStepRetries) + " retries");
        }
        if (spec.timeout && spec.timeout->count() <= 0) {
            throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id,
                               "step '" + spec.id + "' has a non-positive timeout");
        }
    }

    for (const auto& spec : definition.steps) {
        for (const auto& dep : spec.depends_on) {
            if (seen.count(dep) == 0) {
                throw CompileError(CompileErrorKind::UNKNOWN_DEPENDENCY, definition.id,
                                   "step '" + spec.id + "' depends on unknown step '" + dep + "'");
            }
        }
    }
}

StepSpec WorkflowCompiler::resolve_step(const std::string& workflow_id, const StepSpec& spec) const {
    StepSpec resolved = spec;

    if (resolved.ref.empty()) {
        if (!resolved.capability) {
            throw CompileError(CompileErrorKind::INVALID_DEFINITION, workflow_id,
                               "step '" + spec.id + "' has neither a ref nor a capability");
        }
        std::optional<std::string> ref;
        if (registry_) {
            ref = registry_->resolve_capability(*resolved.capability);
        }
        if (!ref) {
            throw CompileError(CompileErrorKind::UNRESOLVED_CAPABILITY, workflow_id,
                               "no registered step provides capability '" + *resolved.capability +
                               "' required by step '" + spec.id + "'");
        }
        resolved.ref = *ref;
    }

    if (registry_ && !registry_->has_step(resolved.ref)) {
        throw CompileError(CompileErrorKind::UNKNOWN_STEP_REF, workflow_id,
                           "step '" + spec.id + "' references unregistered step '" + resolved.ref + "'");
    }
    return resolved;
}

// Depth-first search over dependency edges, visiting ids in sorted order so the
// reported cycle is stable. Returns the cycle without repeating its first id.
std::optional<std::vector<StepId>> WorkflowCompiler::find_cycle(const DependencyMap& deps) {
    enum class Mark { UNVISITED, IN_PROGRESS, DONE };
    std::unordered_map<StepId, Mark> marks;
    for (const auto& [id, _] : deps) {
        marks[id] = Mark::UNVISITED;
    }

    std::vector<StepId> path;
    std::optional<std::vector<StepId>> found;

    std::function<bool(const StepId&)> visit = [&](const StepId& id) -> bool {
        marks[id] = Mark::IN_PROGRESS;
        path.push_back(id);
        for (const auto& dep : deps.at(id)) {
            if (marks[dep] == Mark::IN_PROGRESS) {
                auto start = std::find(path.begin(), path.end(), dep);
                found = std::vector<StepId>(start, path.end());
                return true;
            }
            if (marks[dep] == Mark::UNVISITED && visit(dep)) {
                return true;
            }
        }
        path.pop_back();
        marks[id] = Mark::DONE;
        return false;
    };

    for (const auto& [id, _] : deps) {
        if (marks[id] == Mark::UNVISITED && visit(id)) {
            return found;
        }
    }
    return std::nullopt;
}

// Repeatedly extracts every step whose dependencies all sit in earlier levels
std::vector<std::vector<StepId>> WorkflowCompiler::compute_levels(const DependencyMap& deps) {
    std::vector<std::vector<StepId>> levels;
    std::set<StepId> assigned;

    while (assigned.size() < deps.size()) {
        std::vector<StepId> level;
        for (const auto& [id, dependencies] : deps) {
            if (assigned.count(id)) continue;
            bool ready = std::all_of(dependencies.begin(), dependencies.end(),
                                     [&](const StepId& dep) { return assigned.count(dep) > 0; });
            if (ready) {
                level.push_back(id);   // map iteration keeps ids sorted
            }
        }
        if (level.empty()) {
            // unreachable once find_cycle passed
            throw std::logic_error("level computation made no progress");
        }
        assigned.insert(level.begin(), level.end());
        levels.push_back(std::move(level));
    }
    return levels;
}

} // namespace ucop
