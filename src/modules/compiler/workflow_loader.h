// modules/compiler/workflow_loader.h
#ifndef UCOP_MODULES_COMPILER_WORKFLOW_LOADER_H
#define UCOP_MODULES_COMPILER_WORKFLOW_LOADER_H

#include "core/types/workflow.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ucop {

// Reads workflow definitions from YAML. Accepted shapes:
//
//   workflows:                 # many workflows, key = id
//     blog_post:
//       version: "1.2"
//       steps: [...]
//
//   id: blog_post              # a single workflow
//   steps: [...]
//
// Steps come from `steps` (a list, or a map keyed by step id) or the legacy
// `agents` list. Malformed input throws CompileError(INVALID_DEFINITION).
class WorkflowLoader {
public:
    std::vector<WorkflowDefinition> load_from_string(const std::string& yaml_content) const;
    std::vector<WorkflowDefinition> load_from_file(const std::string& file_path) const;

    static WorkflowDefinition definition_from_json(const std::string& id, const nlohmann::json& doc);

private:
    static StepSpec step_from_json(const std::string& workflow_id, const std::string& location,
                                   const nlohmann::json& step_json);
};

} // namespace ucop

#endif // UCOP_MODULES_COMPILER_WORKFLOW_LOADER_H
