// tests/test_checkpoint_manager.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/checkpoint/checkpoint_manager.h"
#include "modules/compiler/workflow_compiler.h"
#include "core/types/errors.h"
#include "test_support.h"
#include <fstream>

using namespace ucop;
using ucop::testing::TempDir;
using ucop::testing::make_step;
using ucop::testing::make_workflow;

namespace {

CompiledGraph pipeline_graph(const std::string& version = "1.0") {
    return WorkflowCompiler{}.compile(make_workflow("pipeline", {
        make_step("A", "echo"),
        make_step("B", "echo"),
        make_step("C", "echo", {"A", "B"}),
    }, version));
}

JobSnapshot after_first_level() {
    JobSnapshot snapshot;
    snapshot.workflow_id = "pipeline";
    snapshot.workflow_version = "1.0";
    snapshot.next_level = 1;
    snapshot.inputs = {{"topic", "storage"}};
    snapshot.completed_steps = {"A"};
    snapshot.failed_steps["B"] = StepFailure{"timed out", ErrorCode::STEP_TIMEOUT};
    snapshot.outputs["A"] = {{"text", "alpha"}};
    return snapshot;
}

} // namespace

TEST_CASE("Saved checkpoints list newest first and restore intact", "[checkpoint]") {
    TempDir dir;
    CheckpointManager manager(dir.path());

    JobSnapshot first = after_first_level();
    JobSnapshot second = first;
    second.next_level = 2;
    second.completed_steps.insert("C");
    second.outputs["C"] = 3;

    CheckpointId id1 = manager.save("job_1", first);
    CheckpointId id2 = manager.save("job_1", second, "final");
    REQUIRE(id1 != id2);

    auto listed = manager.list("job_1");
    REQUIRE(listed.size() == 2);
    REQUIRE(listed[0].id == id2);
    REQUIRE(listed[0].marker == "final");
    REQUIRE(listed[1].id == id1);
    REQUIRE(listed[1].marker == "level_1");
    REQUIRE(listed[0].sequence > listed[1].sequence);
    REQUIRE(manager.latest("job_1")->id == id2);

    JobSnapshot restored = manager.restore(id1);
    REQUIRE(restored.workflow_id == "pipeline");
    REQUIRE(restored.next_level == 1);
    REQUIRE(restored.inputs["topic"] == "storage");
    REQUIRE(restored.completed_steps == std::set<StepId>{"A"});
    REQUIRE(restored.failed_steps.at("B") == StepFailure{"timed out", ErrorCode::STEP_TIMEOUT});
    REQUIRE(restored.outputs.at("A")["text"] == "alpha");

    REQUIRE(manager.get(id2).job_id == "job_1");
    REQUIRE(manager.list("someone_else").empty());
    REQUIRE_FALSE(manager.latest("someone_else").has_value());
}

TEST_CASE("Cleanup keeps only the most recent checkpoints", "[checkpoint][cleanup]") {
    TempDir dir;
    CheckpointManager manager(dir.path());

    std::vector<CheckpointId> ids;
    for (size_t level = 1; level <= 5; ++level) {
        JobSnapshot snapshot = after_first_level();
        snapshot.next_level = level;
        ids.push_back(manager.save("job_2", snapshot));
    }

    CleanupResult result = manager.cleanup("job_2", 2);
    REQUIRE(result.kept == 2);
    REQUIRE(result.deleted == 3);

    auto remaining = manager.list("job_2");
    REQUIRE(remaining.size() == 2);
    REQUIRE(remaining[0].id == ids[4]);
    REQUIRE(remaining[1].id == ids[3]);
    REQUIRE_THROWS_AS(manager.get(ids[0]), CheckpointNotFound);

    CleanupResult again = manager.cleanup("job_2", 5);
    REQUIRE(again.kept == 2);
    REQUIRE(again.deleted == 0);
}

TEST_CASE("Incompatible snapshots are rejected on restore", "[checkpoint][compat]") {
    TempDir dir;
    CheckpointManager manager(dir.path());
    CheckpointId id = manager.save("job_3", after_first_level());

    SECTION("same structure restores") {
        auto graph = pipeline_graph();
        REQUIRE_NOTHROW(manager.restore(id, &graph));
    }

    SECTION("a renamed step no longer matches") {
        auto graph = WorkflowCompiler{}.compile(make_workflow("pipeline", {
            make_step("A", "echo"),
            make_step("B2", "echo"),
            make_step("C", "echo", {"A", "B2"}),
        }, "2.0"));
        REQUIRE_THROWS_AS(manager.restore(id, &graph), VersionMismatch);
    }

    SECTION("a different workflow never matches") {
        auto graph = WorkflowCompiler{}.compile(make_workflow("other", {make_step("A", "echo")}));
        REQUIRE_THROWS_AS(manager.restore(id, &graph), VersionMismatch);
    }

    SECTION("a step moved into an already finished level") {
        auto graph = WorkflowCompiler{}.compile(make_workflow("pipeline", {
            make_step("A", "echo"),
            make_step("B", "echo"),
            make_step("C", "echo"),
        }, "3.0"));
        REQUIRE_THROWS_AS(manager.restore(id, &graph), VersionMismatch);
    }

    SECTION("without a graph nothing is checked") {
        REQUIRE(manager.restore(id).next_level == 1);
    }
}

TEST_CASE("Unknown and unreadable checkpoints", "[checkpoint][errors]") {
    TempDir dir;
    CheckpointManager manager(dir.path());
    CheckpointId id = manager.save("job_4", after_first_level());

    REQUIRE_THROWS_AS(manager.get("cp_missing"), CheckpointNotFound);
    REQUIRE_THROWS_AS(manager.restore("cp_missing"), CheckpointNotFound);

    // leftovers of an interrupted write and foreign files are not checkpoints
    {
        std::ofstream(dir.path() / "job_4" / ".cp_partial.json.tmp") << "{\"id\": ";
        std::ofstream(dir.path() / "job_4" / "notes.txt") << "hello";
        std::ofstream(dir.path() / "job_4" / "cp_garbage.json") << "not json";
    }
    auto listed = manager.list("job_4");
    REQUIRE(listed.size() == 1);
    REQUIRE(listed[0].id == id);

    REQUIRE_THROWS_AS(manager.get("cp_garbage"), StorageError);
}

TEST_CASE("Save failures raise StorageError", "[checkpoint][errors]") {
    TempDir dir;
    auto blocked = dir.path() / "not_a_directory";
    std::ofstream(blocked) << "occupied";

    CheckpointManager manager(blocked);
    REQUIRE_THROWS_AS(manager.save("job_5", after_first_level()), StorageError);
    REQUIRE_THROWS_AS(CheckpointManager(dir.path()).save("../escape", after_first_level()), StorageError);
}

TEST_CASE("Sequence numbers continue across manager instances", "[checkpoint]") {
    TempDir dir;
    {
        CheckpointManager first(dir.path());
        first.save("job_6", after_first_level());
        first.save("job_6", after_first_level());
    }
    CheckpointManager second(dir.path());
    CheckpointId id = second.save("job_6", after_first_level());
    REQUIRE(second.get(id).sequence == 3);
    REQUIRE(second.list("job_6").front().id == id);

    REQUIRE(second.remove_job("job_6") == 3);
    REQUIRE(second.list("job_6").empty());
}
