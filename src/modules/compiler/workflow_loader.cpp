// modules/compiler/workflow_loader.cpp
#include "modules/compiler/workflow_loader.h"
#include "core/types/errors.h"
#include "common/utils/yaml_json.h"
#include "common/utils/logging.h"
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <fstream>
#include <sstream>

namespace ucop {

namespace {

[[noreturn]] void invalid(const std::string& workflow_id, const std::string& message) {
    throw CompileError(CompileErrorKind::INVALID_DEFINITION, workflow_id, message);
}

std::string scalar_as_string(const std::string& workflow_id, const std::string& location, const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    if (v.is_number_float()) return v.dump();   // unquoted `version: 1.0` arrives as a double
    invalid(workflow_id, location + " must be a string, got " + v.dump());
}

std::vector<std::string> string_list(const std::string& workflow_id, const std::string& location, const nlohmann::json& v) {
    std::vector<std::string> out;
    if (v.is_null()) return out;
    if (v.is_string()) {
        out.push_back(v.get<std::string>());
        return out;
    }
    if (!v.is_array()) {
        invalid(workflow_id, location + " must be a string or a list of strings");
    }
    for (const auto& item : v) {
        if (!item.is_string()) {
            invalid(workflow_id, location + " must only contain strings, got " + item.dump());
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

bool bool_field(const std::string& workflow_id, const std::string& location, const nlohmann::json& v) {
    if (!v.is_boolean()) {
        invalid(workflow_id, location + " must be a boolean, got " + v.dump());
    }
    return v.get<bool>();
}

} // namespace

std::vector<WorkflowDefinition> WorkflowLoader::load_from_string(const std::string& yaml_content) const {
    nlohmann::json doc;
    try {
        doc = parse_yaml_document(yaml_content);
    } catch (const YAML::Exception& e) {
        invalid("<yaml>", std::string("YAML parse error: ") + e.what());
    }

    if (!doc.is_object()) {
        invalid("<yaml>", "document root must be a mapping");
    }

    std::vector<WorkflowDefinition> definitions;
    if (doc.contains("workflows")) {
        const auto& workflows = doc["workflows"];
        if (!workflows.is_object()) {
            invalid("<yaml>", "'workflows' must be a mapping of workflow id to definition");
        }
        for (auto it = workflows.begin(); it != workflows.end(); ++it) {
            definitions.push_back(definition_from_json(it.key(), it.value()));
        }
    } else {
        std::string id;
        if (doc.contains("id")) {
            id = scalar_as_string("<yaml>", "'id'", doc["id"]);
        } else if (doc.contains("name")) {
            id = scalar_as_string("<yaml>", "'name'", doc["name"]);
        } else {
            invalid("<yaml>", "single-workflow document needs an 'id' or 'name'");
        }
        definitions.push_back(definition_from_json(id, doc));
    }

    log_debug("loader", "Loaded " + std::to_string(definitions.size()) + " workflow definition(s)");
    return definitions;
}

std::vector<WorkflowDefinition> WorkflowLoader::load_from_file(const std::string& file_path) const {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        invalid("<file>", "cannot open workflow file: " + file_path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_string(buffer.str());
}

WorkflowDefinition WorkflowLoader::definition_from_json(const std::string& id, const nlohmann::json& doc) {
    if (!doc.is_object()) {
        invalid(id, "workflow definition must be a mapping");
    }

    WorkflowDefinition def;
    def.id = id;
    if (doc.contains("version")) {
        def.version = scalar_as_string(id, "'version'", doc["version"]);
    }
    if (doc.contains("description") && !doc["description"].is_null()) {
        def.description = scalar_as_string(id, "'description'", doc["description"]);
    }
    if (doc.contains("metadata") && !doc["metadata"].is_null()) {
        if (!doc["metadata"].is_object()) {
            invalid(id, "'metadata' must be a mapping");
        }
        def.metadata = doc["metadata"];
    }
    if (doc.contains("merge_policy") && !doc["merge_policy"].is_null()) {
        const auto& policy = doc["merge_policy"];
        if (!policy.is_object() && !policy.is_string()) {
            invalid(id, "'merge_policy' must be a strategy name or a mapping");
        }
        def.merge_policy = policy;
    }

    const char* steps_key = doc.contains("steps") ? "steps" : (doc.contains("agents") ? "agents" : nullptr);
    if (steps_key == nullptr) {
        invalid(id, "workflow has no 'steps'");
    }

    const auto& steps = doc[steps_key];
    if (steps.is_array()) {
        for (size_t i = 0; i < steps.size(); ++i) {
            std::string location = std::string(steps_key) + "[" + std::to_string(i) + "]";
            def.steps.push_back(step_from_json(id, location, steps[i]));
        }
    } else if (steps.is_object()) {
        for (auto it = steps.begin(); it != steps.end(); ++it) {
            nlohmann::json step_json = it.value().is_null() ? nlohmann::json::object() : it.value();
            if (!step_json.is_object()) {
                invalid(id, std::string(steps_key) + "." + it.key() + " must be a mapping");
            }
            if (!step_json.contains("id") && !step_json.contains("name")) {
                step_json["id"] = it.key();
            }
            def.steps.push_back(step_from_json(id, std::string(steps_key) + "." + it.key(), step_json));
        }
    } else {
        invalid(id, "'" + std::string(steps_key) + "' must be a list or a mapping");
    }
    return def;
}

StepSpec WorkflowLoader::step_from_json(const std::string& workflow_id, const std::string& location,
                                        const nlohmann::json& step_json) {
    if (!step_json.is_object()) {
        invalid(workflow_id, location + " must be a mapping");
    }

    StepSpec spec;
    if (step_json.contains("id")) {
        spec.id = scalar_as_string(workflow_id, location + ".id", step_json["id"]);
    } else if (step_json.contains("name")) {
        spec.id = scalar_as_string(workflow_id, location + ".name", step_json["name"]);
    } else {
        invalid(workflow_id, location + " has no 'id'");
    }

    const std::string where = location + " ('" + spec.id + "')";

    if (step_json.contains("ref")) {
        spec.ref = scalar_as_string(workflow_id, where + ".ref", step_json["ref"]);
    } else if (step_json.contains("agent")) {
        spec.ref = scalar_as_string(workflow_id, where + ".agent", step_json["agent"]);
    }

    if (step_json.contains("capability") && !step_json["capability"].is_null()) {
        spec.capability = scalar_as_string(workflow_id, where + ".capability", step_json["capability"]);
    }

    if (step_json.contains("depends_on")) {
        spec.depends_on = string_list(workflow_id, where + ".depends_on", step_json["depends_on"]);
    }

    if (step_json.contains("timeout") && !step_json["timeout"].is_null()) {
        const auto& t = step_json["timeout"];
        if (!t.is_number() || t.get<double>() <= 0.0) {
            invalid(workflow_id, where + ".timeout must be a positive number of seconds");
        }
        auto ms = static_cast<int64_t>(std::llround(t.get<double>() * 1000.0));
        spec.timeout = std::chrono::milliseconds(ms > 0 ? ms : 1);
    }

    if (step_json.contains("retries")) {
        const auto& r = step_json["retries"];
        if (!r.is_number_integer() || (!r.is_number_unsigned() && r.get<int64_t>() < 0)) {
            invalid(workflow_id, where + ".retries must be a non-negative integer");
        }
        if (r.get<uint64_t>() > static_cast<uint64_t>(kMaxStepRetries)) {
            invalid(workflow_id, where + ".retries must not exceed " + std::to_string(kMaxStepRetries));
        }
        spec.retries = static_cast<int>(r.get<uint64_t>());
    }

    if (step_json.contains("continue_on_error")) {
        spec.continue_on_error = bool_field(workflow_id, where + ".continue_on_error", step_json["continue_on_error"]);
    }
    if (step_json.contains("parallel")) {
        spec.parallel = bool_field(workflow_id, where + ".parallel", step_json["parallel"]);
    }
    if (step_json.contains("mutex_tag") && !step_json["mutex_tag"].is_null()) {
        spec.mutex_tag = scalar_as_string(workflow_id, where + ".mutex_tag", step_json["mutex_tag"]);
    }

    if (step_json.contains("inputs") && !step_json["inputs"].is_null()) {
        if (!step_json["inputs"].is_object()) {
            invalid(workflow_id, where + ".inputs must be a mapping");
        }
        spec.inputs = step_json["inputs"];
    }
    if (step_json.contains("metadata") && !step_json["metadata"].is_null()) {
        if (!step_json["metadata"].is_object()) {
            invalid(workflow_id, where + ".metadata must be a mapping");
        }
        spec.metadata = step_json["metadata"];
    }
    return spec;
}

} // namespace ucop
