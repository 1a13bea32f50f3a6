// modules/compiler/workflow_catalog.cpp
#include "modules/compiler/workflow_catalog.h"
#include "core/types/errors.h"
#include "common/utils/logging.h"

namespace ucop {

WorkflowCatalog::WorkflowCatalog(WorkflowCompiler compiler)
    : compiler_(std::move(compiler)) {}

std::shared_ptr<const CompiledGraph> WorkflowCatalog::register_workflow(const WorkflowDefinition& definition) {
    Key key{definition.id, definition.version};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = compiled_.find(key);
        if (it != compiled_.end()) {
            if (!(it->second.definition == definition)) {
                throw CompileError(CompileErrorKind::INVALID_DEFINITION, definition.id,
                                   "version '" + definition.version + "' is already registered with a different definition");
            }
            current_version_[definition.id] = definition.version;
            return it->second.graph;
        }
    }

    // Compile outside the lock; a throw here leaves the store untouched
    auto graph = std::make_shared<const CompiledGraph>(compiler_.compile(definition));

    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = compiled_.emplace(key, Entry{definition, graph});
    current_version_[definition.id] = definition.version;
    if (inserted) {
        log_info("catalog", "Registered workflow '" + definition.id + "' v" + definition.version);
    }
    return it->second.graph;
}

std::shared_ptr<const CompiledGraph> WorkflowCatalog::get(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = current_version_.find(workflow_id);
    if (current == current_version_.end()) {
        throw WorkflowNotFound("Workflow not found: " + workflow_id);
    }
    return compiled_.at({workflow_id, current->second}).graph;
}

std::shared_ptr<const CompiledGraph> WorkflowCatalog::get(const std::string& workflow_id, const std::string& version) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = compiled_.find({workflow_id, version});
    if (it == compiled_.end()) {
        throw WorkflowNotFound("Workflow not found: " + workflow_id + " v" + version);
    }
    return it->second.graph;
}

const WorkflowDefinition& WorkflowCatalog::definition(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = current_version_.find(workflow_id);
    if (current == current_version_.end()) {
        throw WorkflowNotFound("Workflow not found: " + workflow_id);
    }
    return compiled_.at({workflow_id, current->second}).definition;
}

bool WorkflowCatalog::contains(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_version_.count(workflow_id) > 0;
}

std::vector<std::string> WorkflowCatalog::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(current_version_.size());
    for (const auto& [id, _] : current_version_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<std::string> WorkflowCatalog::versions(const std::string& workflow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [key, _] : compiled_) {
        if (key.first == workflow_id) {
            out.push_back(key.second);
        }
    }
    return out;
}

} // namespace ucop
