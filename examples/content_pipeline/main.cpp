// examples/content_pipeline/main.cpp
#include <functional>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "core/engine.h"
#include "common/config/engine_config.h"
#include "common/utils/logging.h"
#include "modules/compiler/workflow_loader.h"

using namespace ucop;

namespace {

void register_demo_steps(StepRegistry& registry) {
    registry.register_function("web_research", [](const StepInput& in) {
        std::string topic = in.inputs.value("topic", "");
        return Value{{"notes", {topic + " basics", topic + " pitfalls"}}, {"keywords", {topic}}};
    });
    registry.register_capability("content.research", "web_research");

    registry.register_function("seo_keywords", [](const StepInput& in) {
        std::string topic = in.inputs.value("topic", "");
        return Value{{"keywords", {topic, topic + " tutorial"}}};
    });

    registry.register_function("writer", [](const StepInput& in) {
        std::string body;
        for (const auto& note : in.inputs["notes"]) {
            body += "- " + note.get<std::string>() + "\n";
        }
        return Value{{"title", in.inputs["title"]}, {"body", body}};
    });

    registry.register_function("seo_review", [](const StepInput& in) -> Value {
        if (in.inputs.value("body", "").size() < 100) {
            throw std::runtime_error("article too short for a meaningful SEO review");
        }
        return Value{{"score", 90}};
    });

    registry.register_function("publisher", [](const StepInput& in) {
        size_t slug = std::hash<std::string>{}(in.inputs.value("title", "")) % 10000;
        return Value{{"url", "https://example.com/posts/" + std::to_string(slug)}};
    });
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <workflows.yaml> [topic] [config.yaml]\n";
        return 1;
    }
    const std::string topic = argc > 2 ? argv[2] : "event sourcing";

    try {
        // 1. Configuration
        EngineConfig config = argc > 3 ? load_engine_config(argv[3]) : load_engine_config();
        set_log_level(config.log_level);

        // 2. Steps and workflows
        StepRegistry registry;
        register_demo_steps(registry);

        WorkflowCatalog catalog{WorkflowCompiler{&registry}};
        for (const auto& definition : WorkflowLoader{}.load_from_file(argv[1])) {
            catalog.register_workflow(definition);
        }

        // 3. Engine
        CheckpointManager checkpoints(config.checkpoint_dir);
        EventBus bus(config.event_history_limit);
        JobExecutionEngine engine(catalog, registry, checkpoints, bus, config);

        JobId job = engine.create_job("blog_post", {{"topic", topic}});
        engine.subscribe(job, [](const Event& e) {
            std::cout << "[event #" << e.sequence << "] " << to_string(e.type);
            if (e.step_id) {
                std::cout << " " << *e.step_id;
            }
            std::cout << " " << e.payload.dump() << "\n";
        });

        // 4. Run
        JobStatus status = engine.execute_job(job);
        std::cout << "\nJob " << job << " finished: " << to_string(status) << "\n";
        std::cout << to_json(engine.get_status(job)).dump(2) << "\n";

        Job record = engine.get_job(job);
        nlohmann::json outputs = nlohmann::json::object();
        for (const auto& [step, output] : record.outputs) {
            outputs[step] = output;
        }
        std::cout << "Outputs:\n" << outputs.dump(2) << "\n";
        std::cout << "Checkpoints kept in " << checkpoints.root() << ": "
                  << engine.list_checkpoints(job).size() << "\n";

        return status == JobStatus::COMPLETED ? 0 : 2;
    } catch (const CompileError& e) {
        std::cerr << "[COMPILE ERROR] " << to_string(e.kind()) << ": " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
}
