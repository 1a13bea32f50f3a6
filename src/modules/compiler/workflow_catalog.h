// modules/compiler/workflow_catalog.h
#ifndef UCOP_MODULES_COMPILER_WORKFLOW_CATALOG_H
#define UCOP_MODULES_COMPILER_WORKFLOW_CATALOG_H

#include "modules/compiler/workflow_compiler.h"
#include "core/types/workflow.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ucop {

// Workflow store. Every distinct (id, version) is compiled once; the most
// recently registered version of an id is its current one.
class WorkflowCatalog {
public:
    explicit WorkflowCatalog(WorkflowCompiler compiler = WorkflowCompiler{});

    // Compiles first, stores only on success. Registering an identical
    // (id, version) again returns the cached graph; a different definition
    // under an existing (id, version) is rejected.
    std::shared_ptr<const CompiledGraph> register_workflow(const WorkflowDefinition& definition);

    std::shared_ptr<const CompiledGraph> get(const std::string& workflow_id) const;
    std::shared_ptr<const CompiledGraph> get(const std::string& workflow_id, const std::string& version) const;
    const WorkflowDefinition& definition(const std::string& workflow_id) const;

    bool contains(const std::string& workflow_id) const;
    std::vector<std::string> list() const;
    std::vector<std::string> versions(const std::string& workflow_id) const;

private:
    struct Entry {
        WorkflowDefinition definition;
        std::shared_ptr<const CompiledGraph> graph;
    };
    using Key = std::pair<std::string, std::string>;

    WorkflowCompiler compiler_;
    mutable std::mutex mutex_;
    std::map<Key, Entry> compiled_;
    std::map<std::string, std::string> current_version_;
};

} // namespace ucop

#endif // UCOP_MODULES_COMPILER_WORKFLOW_CATALOG_H
