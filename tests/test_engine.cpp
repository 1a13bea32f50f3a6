// tests/test_engine.cpp
#include <catch2/catch_test_macros.hpp>
#include "core/engine.h"
#include "test_support.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace ucop;
using namespace std::chrono_literals;
using ucop::testing::TempDir;
using ucop::testing::make_step;
using ucop::testing::make_workflow;

namespace {

// Counts how often each step was dispatched
class DispatchLog {
public:
    void hit(const StepId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[id];
    }
    int count(const StepId& id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(id);
        return it == calls_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<StepId, int> calls_;
};

struct Harness {
    TempDir dir;
    StepRegistry registry;
    WorkflowCatalog catalog{WorkflowCompiler{&registry}};
    CheckpointManager checkpoints;
    EventBus bus;
    std::shared_ptr<DispatchLog> dispatched = std::make_shared<DispatchLog>();
    std::atomic<bool> pause_armed{false};
    std::atomic<bool> cancel_armed{false};
    std::unique_ptr<JobExecutionEngine> engine;

    explicit Harness(EngineConfig config = {}, bool blocked_storage = false)
        : checkpoints(storage_root(dir.path(), blocked_storage)) {
        auto log = dispatched;
        registry.register_function("echo", [log](const StepInput& in) {
            log->hit(in.step_id);
            return in.inputs;
        });
        registry.register_function("fail", [log](const StepInput& in) -> Value {
            log->hit(in.step_id);
            throw std::runtime_error(in.step_id + " broke");
        });
        registry.register_function("slow_echo", [log](const StepInput& in) {
            log->hit(in.step_id);
            std::this_thread::sleep_for(30ms);
            return in.inputs;
        });
        registry.register_function("pausing", [this, log](const StepInput& in) {
            log->hit(in.step_id);
            if (pause_armed.exchange(false)) {
                engine->pause_job(in.job_id);
            }
            std::this_thread::sleep_for(10ms);
            return in.inputs;
        });
        registry.register_function("cancelling", [this, log](const StepInput& in) {
            log->hit(in.step_id);
            if (cancel_armed.exchange(false)) {
                engine->cancel_job(in.job_id);
            }
            return in.inputs;
        });
        registry.register_function("hang", [log](const StepInput& in) {
            log->hit(in.step_id);
            while (!in.stop_requested()) {
                std::this_thread::sleep_for(5ms);
            }
            return Value("too late");
        });
        engine = std::make_unique<JobExecutionEngine>(catalog, registry, checkpoints, bus, config);
    }

    ~Harness() {
        engine.reset();
    }

    static std::filesystem::path storage_root(const std::filesystem::path& base, bool blocked) {
        auto root = base / "checkpoints";
        if (blocked) {
            std::ofstream(root) << "a file where the checkpoint directory should be";
        }
        return root;
    }

    std::vector<EventType> event_types(const JobId& job_id) const {
        std::vector<EventType> types;
        for (const auto& e : bus.history(job_id)) {
            types.push_back(e.type);
        }
        return types;
    }

    size_t count_events(const JobId& job_id, EventType type) const {
        auto types = event_types(job_id);
        return static_cast<size_t>(std::count(types.begin(), types.end(), type));
    }
};

// {A, B} -> C, where C stitches its dependencies' outputs together
WorkflowDefinition article_workflow(const std::string& first_ref = "echo", const std::string& second_ref = "echo") {
    auto a = make_step("A", first_ref);
    a.inputs = {{"text", "A({{ inputs.topic }})"}};
    auto b = make_step("B", second_ref);
    b.inputs = {{"text", "B({{ inputs.topic }})"}};
    auto c = make_step("C", "echo", {"A", "B"});
    c.inputs = {{"text", "C[{{ outputs.A.text }}+{{ outputs.B.text }}]"}, {"sources", "{{ outputs.A }}"}};
    return make_workflow("article", {a, b, c});
}

} // namespace

TEST_CASE("A job runs every level and completes", "[engine]") {
    Harness h;
    h.catalog.register_workflow(article_workflow());

    JobId job = h.engine->create_job("article", {{"topic", "raft"}});
    REQUIRE(h.engine->get_status(job).status == JobStatus::PENDING);

    REQUIRE(h.engine->execute_job(job) == JobStatus::COMPLETED);

    Job record = h.engine->get_job(job);
    REQUIRE(record.completed_steps == std::set<StepId>{"A", "B", "C"});
    REQUIRE(record.outputs.at("C")["text"] == "C[A(raft)+B(raft)]");
    REQUIRE(record.outputs.at("C")["sources"] == Value{{"text", "A(raft)"}});
    REQUIRE(record.step_records.at("C").status == StepStatus::COMPLETED);
    REQUIRE(record.step_records.at("C").attempts == 1);

    auto status = h.engine->get_status(job);
    REQUIRE(status.status == JobStatus::COMPLETED);
    REQUIRE(status.completed_step_count == 3);
    REQUIRE(status.total_step_count == 3);
    REQUIRE(status.current_level == 2);
    REQUIRE(status.level_count == 2);

    REQUIRE(h.event_types(job) == std::vector<EventType>{
        EventType::JOB_CREATED,
        EventType::JOB_STARTED,
        EventType::LEVEL_STARTED,
        EventType::STEP_COMPLETED,
        EventType::STEP_COMPLETED,
        EventType::CHECKPOINT_SAVED,
        EventType::LEVEL_COMPLETED,
        EventType::LEVEL_STARTED,
        EventType::STEP_COMPLETED,
        EventType::CHECKPOINT_SAVED,
        EventType::LEVEL_COMPLETED,
        EventType::JOB_COMPLETED,
    });

    auto history = h.bus.history(job);
    for (size_t i = 0; i < history.size(); ++i) {
        REQUIRE(history[i].sequence == i + 1);
    }
    REQUIRE(h.engine->list_checkpoints(job).size() == 2);
}

TEST_CASE("A failing step without continue_on_error fails the job", "[engine][failure]") {
    Harness h;
    h.catalog.register_workflow(article_workflow("echo", "fail"));

    JobId job = h.engine->create_job("article", {{"topic", "paxos"}});
    REQUIRE(h.engine->execute_job(job) == JobStatus::FAILED);

    Job record = h.engine->get_job(job);
    REQUIRE(record.status == JobStatus::FAILED);
    REQUIRE(record.outputs.size() == 1);
    REQUIRE(record.outputs.at("A")["text"] == "A(paxos)");
    REQUIRE(record.failed_steps.at("B").error == "B broke");
    REQUIRE(record.failed_steps.at("B").code == ErrorCode::STEP_FAILURE);
    REQUIRE(record.error_message.has_value());
    REQUIRE(record.error_message->find("B") != std::string::npos);
    REQUIRE(h.dispatched->count("C") == 0);

    auto checkpoints = h.engine->list_checkpoints(job);
    REQUIRE(checkpoints.size() == 1);
    REQUIRE(checkpoints[0].marker == "level_1");
    REQUIRE(checkpoints[0].snapshot.next_level == 1);
    REQUIRE(checkpoints[0].snapshot.completed_steps == std::set<StepId>{"A"});
    REQUIRE(checkpoints[0].snapshot.status == JobStatus::FAILED);

    REQUIRE(h.count_events(job, EventType::STEP_FAILED) == 1);
    REQUIRE(h.event_types(job).back() == EventType::JOB_FAILED);
    REQUIRE(h.engine->get_status(job).failed_step_count == 1);
}

TEST_CASE("continue_on_error skips only the failed step's dependents", "[engine][failure]") {
    Harness h;
    auto a = make_step("A", "fail");
    a.continue_on_error = true;
    h.catalog.register_workflow(make_workflow("tolerant", {
        a,
        make_step("X", "echo"),
        make_step("B", "echo", {"A"}),
        make_step("Y", "echo", {"X"}),
        make_step("C", "echo", {"B"}),
    }));

    JobId job = h.engine->create_job("tolerant");
    REQUIRE(h.engine->execute_job(job) == JobStatus::COMPLETED);

    Job record = h.engine->get_job(job);
    REQUIRE(record.completed_steps == std::set<StepId>{"X", "Y"});
    REQUIRE(record.skipped_steps == std::set<StepId>{"B", "C"});
    REQUIRE(record.failed_steps.count("A") == 1);
    REQUIRE(record.step_records.at("C").status == StepStatus::SKIPPED);
    REQUIRE(h.dispatched->count("B") == 0);
    REQUIRE(h.dispatched->count("C") == 0);
    REQUIRE(h.dispatched->count("Y") == 1);
    REQUIRE(h.count_events(job, EventType::STEP_SKIPPED) == 2);
    REQUIRE(h.engine->get_status(job).skipped_step_count == 2);
}

TEST_CASE("A timed-out step is recorded with its own error code", "[engine][timeout]") {
    Harness h;
    auto slow = make_step("slow", "hang");
    slow.timeout = 30ms;
    h.catalog.register_workflow(make_workflow("slow", {slow, make_step("fast", "echo")}));

    JobId job = h.engine->create_job("slow");
    REQUIRE(h.engine->execute_job(job) == JobStatus::FAILED);

    Job record = h.engine->get_job(job);
    REQUIRE(record.failed_steps.at("slow").code == ErrorCode::STEP_TIMEOUT);
    REQUIRE(record.step_records.at("slow").status == StepStatus::TIMED_OUT);
    REQUIRE(record.completed_steps == std::set<StepId>{"fast"});
}

TEST_CASE("Pause lets the running level finish, resume reproduces the uninterrupted run", "[engine][pause]") {
    Harness h;
    h.catalog.register_workflow(article_workflow("pausing", "slow_echo"));

    JobId reference = h.engine->create_job("article", {{"topic", "crdt"}});
    REQUIRE(h.engine->execute_job(reference) == JobStatus::COMPLETED);

    h.pause_armed = true;
    JobId job = h.engine->create_job("article", {{"topic", "crdt"}});
    REQUIRE(h.engine->execute_job(job) == JobStatus::PAUSED);

    auto status = h.engine->get_status(job);
    REQUIRE(status.status == JobStatus::PAUSED);
    REQUIRE(status.completed_step_count == 2);
    REQUIRE(status.current_level == 1);
    REQUIRE(h.dispatched->count("C") == 1);   // only the reference job got there

    auto types = h.event_types(job);
    auto level_done = std::find(types.begin(), types.end(), EventType::LEVEL_COMPLETED);
    auto paused = std::find(types.begin(), types.end(), EventType::JOB_PAUSED);
    REQUIRE(level_done != types.end());
    REQUIRE(paused != types.end());
    REQUIRE(level_done < paused);
    REQUIRE(h.engine->list_checkpoints(job).front().marker == "paused");

    REQUIRE_THROWS_AS(h.engine->pause_job(job), InvalidTransition);

    REQUIRE(h.engine->resume_job(job) == JobStatus::COMPLETED);
    REQUIRE(h.engine->get_job(job).outputs == h.engine->get_job(reference).outputs);
    REQUIRE(h.count_events(job, EventType::JOB_RESUMED) == 1);
}

TEST_CASE("Resume from an explicit checkpoint", "[engine][pause][checkpoint]") {
    Harness h;
    h.catalog.register_workflow(article_workflow("pausing", "echo"));

    h.pause_armed = true;
    JobId job = h.engine->create_job("article", {{"topic", "gossip"}});
    REQUIRE(h.engine->execute_job(job) == JobStatus::PAUSED);

    auto checkpoints = h.engine->list_checkpoints(job);
    auto level_one = std::find_if(checkpoints.begin(), checkpoints.end(),
                                  [](const Checkpoint& cp) { return cp.marker == "level_1"; });
    REQUIRE(level_one != checkpoints.end());

    SECTION("checkpoint of this job") {
        REQUIRE(h.engine->resume_job(job, level_one->id) == JobStatus::COMPLETED);
        Job record = h.engine->get_job(job);
        REQUIRE(record.restored_from == std::optional<CheckpointId>(level_one->id));
        REQUIRE(record.outputs.at("C")["text"] == "C[A(gossip)+B(gossip)]");
    }

    SECTION("checkpoint of another job") {
        JobId other = h.engine->create_job("article", {{"topic", "other"}});
        REQUIRE(h.engine->execute_job(other) == JobStatus::COMPLETED);
        auto foreign = h.engine->list_checkpoints(other).front().id;
        REQUIRE_THROWS_AS(h.engine->resume_job(job, foreign), CheckpointNotFound);
        REQUIRE(h.engine->get_status(job).status == JobStatus::PAUSED);
    }

    SECTION("unknown checkpoint") {
        REQUIRE_THROWS_AS(h.engine->resume_job(job, std::string("cp_nope")), CheckpointNotFound);
    }
}

TEST_CASE("Cancellation", "[engine][cancel]") {
    SECTION("pending job is cancelled at once") {
        Harness h;
        h.catalog.register_workflow(article_workflow());
        JobId job = h.engine->create_job("article");
        h.engine->cancel_job(job);
        REQUIRE(h.engine->get_status(job).status == JobStatus::CANCELLED);
        REQUIRE_THROWS_AS(h.engine->execute_job(job), InvalidTransition);
        REQUIRE(h.dispatched->count("A") == 0);
    }

    SECTION("running job stops at the next level boundary") {
        Harness h;
        h.catalog.register_workflow(article_workflow("cancelling", "echo"));
        h.cancel_armed = true;
        JobId job = h.engine->create_job("article", {{"topic", "x"}});
        REQUIRE(h.engine->execute_job(job) == JobStatus::CANCELLED);

        Job record = h.engine->get_job(job);
        REQUIRE(record.completed_steps == std::set<StepId>{"A", "B"});
        REQUIRE(h.dispatched->count("C") == 0);
        auto latest = h.engine->list_checkpoints(job).front();
        REQUIRE(latest.marker == "cancelled");
        REQUIRE(latest.snapshot.status == JobStatus::CANCELLED);
        REQUIRE(h.event_types(job).back() == EventType::JOB_CANCELLED);
    }

    SECTION("paused job flushes a final checkpoint") {
        Harness h;
        h.catalog.register_workflow(article_workflow("pausing", "echo"));
        h.pause_armed = true;
        JobId job = h.engine->create_job("article", {{"topic", "x"}});
        REQUIRE(h.engine->execute_job(job) == JobStatus::PAUSED);

        h.engine->cancel_job(job);
        REQUIRE(h.engine->get_status(job).status == JobStatus::CANCELLED);
        REQUIRE(h.engine->list_checkpoints(job).front().marker == "cancelled");
        REQUIRE_THROWS_AS(h.engine->resume_job(job), InvalidTransition);
        REQUIRE_THROWS_AS(h.engine->cancel_job(job), InvalidTransition);
    }
}

TEST_CASE("Illegal transitions and unknown ids are rejected", "[engine][errors]") {
    Harness h;
    h.catalog.register_workflow(article_workflow());

    REQUIRE_THROWS_AS(h.engine->create_job("no_such_workflow"), WorkflowNotFound);
    REQUIRE_THROWS_AS(h.engine->create_job("article", Value::array()), std::invalid_argument);
    REQUIRE_THROWS_AS(h.engine->get_status("job_missing"), JobNotFound);
    REQUIRE_THROWS_AS(h.engine->execute_job("job_missing"), JobNotFound);

    JobId job = h.engine->create_job("article");
    REQUIRE_THROWS_AS(h.engine->pause_job(job), InvalidTransition);
    REQUIRE_THROWS_AS(h.engine->resume_job(job), InvalidTransition);

    REQUIRE(h.engine->execute_job(job) == JobStatus::COMPLETED);
    REQUIRE_THROWS_AS(h.engine->execute_job(job), InvalidTransition);
    REQUIRE_THROWS_AS(h.engine->pause_job(job), InvalidTransition);
    REQUIRE_THROWS_AS(h.engine->resume_job(job), InvalidTransition);
    REQUIRE_THROWS_AS(h.engine->cancel_job(job), InvalidTransition);

    REQUIRE(h.engine->list_jobs() == std::vector<JobId>{job});
    REQUIRE(h.engine->list_jobs(JobStatus::COMPLETED).size() == 1);
    REQUIRE(h.engine->list_jobs(JobStatus::FAILED).empty());
}

TEST_CASE("Checkpoint save failures become warnings, not job failures", "[engine][checkpoint]") {
    EngineConfig config;
    config.checkpoint_save_attempts = 2;
    config.checkpoint_retry_backoff = 1ms;
    Harness h(config, true);
    h.catalog.register_workflow(article_workflow());

    JobId job = h.engine->create_job("article", {{"topic", "disk"}});
    REQUIRE(h.engine->execute_job(job) == JobStatus::COMPLETED);
    REQUIRE(h.engine->get_job(job).outputs.size() == 3);

    REQUIRE(h.count_events(job, EventType::CHECKPOINT_FAILED) == 2);
    REQUIRE(h.count_events(job, EventType::CHECKPOINT_SAVED) == 0);
    for (const auto& e : h.bus.history(job)) {
        if (e.type == EventType::CHECKPOINT_FAILED) {
            REQUIRE(e.payload["attempts"] == 2);
            REQUIRE_FALSE(e.payload["error"].get<std::string>().empty());
        }
    }
}

TEST_CASE("A checkpoint save succeeds once storage recovers", "[engine][checkpoint]") {
    EngineConfig config;
    config.checkpoint_save_attempts = 3;
    config.checkpoint_retry_backoff = 400ms;
    Harness h(config, true);
    h.catalog.register_workflow(article_workflow());

    // unblock storage shortly after the first level's steps report in,
    // well inside the first retry backoff
    std::thread unblocker;
    std::atomic<bool> armed{true};
    h.bus.subscribe(EventFilter{}, [&](const Event& e) {
        if (e.type == EventType::STEP_COMPLETED && armed.exchange(false)) {
            unblocker = std::thread([root = h.checkpoints.root()] {
                std::this_thread::sleep_for(100ms);
                std::filesystem::remove(root);
            });
        }
    });

    JobId job = h.engine->create_job("article", {{"topic", "flaky disk"}});
    JobStatus status = h.engine->execute_job(job);
    if (unblocker.joinable()) {
        unblocker.join();
    }
    REQUIRE(status == JobStatus::COMPLETED);

    REQUIRE(h.count_events(job, EventType::CHECKPOINT_FAILED) == 0);
    std::vector<int> attempts;
    for (const auto& e : h.bus.history(job)) {
        if (e.type == EventType::CHECKPOINT_SAVED) {
            attempts.push_back(e.payload["attempts"].get<int>());
        }
    }
    REQUIRE(attempts == std::vector<int>{2, 1});
    REQUIRE(h.engine->list_checkpoints(job).size() == 2);
}

TEST_CASE("Old checkpoints are pruned after each save", "[engine][checkpoint]") {
    EngineConfig config;
    config.checkpoint_keep_last = 1;
    Harness h(config);
    h.catalog.register_workflow(article_workflow());

    JobId job = h.engine->create_job("article");
    REQUIRE(h.engine->execute_job(job) == JobStatus::COMPLETED);
    auto checkpoints = h.engine->list_checkpoints(job);
    REQUIRE(checkpoints.size() == 1);
    REQUIRE(checkpoints[0].marker == "level_2");
}

TEST_CASE("A job can be recovered by a fresh engine", "[engine][recover]") {
    Harness h;
    h.catalog.register_workflow(article_workflow("pausing", "echo"));
    h.pause_armed = true;
    JobId job = h.engine->create_job("article", {{"topic", "wal"}});
    REQUIRE(h.engine->execute_job(job) == JobStatus::PAUSED);

    // a second process sharing the checkpoint directory
    WorkflowCatalog catalog{WorkflowCompiler{&h.registry}};
    catalog.register_workflow(article_workflow("pausing", "echo"));
    CheckpointManager checkpoints(h.checkpoints.root());
    EventBus bus;
    JobExecutionEngine engine(catalog, h.registry, checkpoints, bus);

    REQUIRE_THROWS_AS(engine.recover_job("job_unknown"), CheckpointNotFound);

    REQUIRE(engine.recover_job(job) == job);
    REQUIRE(engine.get_status(job).status == JobStatus::PAUSED);
    REQUIRE(engine.get_status(job).current_level == 1);
    REQUIRE(engine.get_job(job).restored_from.has_value());
    REQUIRE_THROWS_AS(engine.recover_job(job), InvalidTransition);
    REQUIRE(bus.history(job).front().type == EventType::JOB_RECOVERED);

    REQUIRE(engine.resume_job(job) == JobStatus::COMPLETED);
    REQUIRE(engine.get_job(job).outputs.at("C")["text"] == "C[A(wal)+B(wal)]");
    REQUIRE(h.dispatched->count("A") == 1);
}

TEST_CASE("Jobs can run asynchronously", "[engine][async]") {
    Harness h;
    h.catalog.register_workflow(article_workflow("slow_echo", "slow_echo"));

    JobId first = h.engine->create_job("article", {{"topic", "one"}});
    JobId second = h.engine->create_job("article", {{"topic", "two"}});
    auto f1 = h.engine->execute_job_async(first);
    auto f2 = h.engine->execute_job_async(second);

    REQUIRE(f1.get() == JobStatus::COMPLETED);
    REQUIRE(f2.get() == JobStatus::COMPLETED);
    REQUIRE(h.engine->get_job(second).outputs.at("C")["text"] == "C[A(two)+B(two)]");
}

TEST_CASE("Finished async runners are reaped", "[engine][async]") {
    Harness h;
    h.catalog.register_workflow(make_workflow("ping", {make_step("ping", "echo")}));

    for (int i = 0; i < 50; ++i) {
        REQUIRE(h.engine->execute_job_async(h.engine->create_job("ping")).get() == JobStatus::COMPLETED);
    }

    // a runner counts as finished once its thread body has returned
    auto deadline = std::chrono::steady_clock::now() + 2s;
    size_t retained = h.engine->reap_runners();
    while (retained > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
        retained = h.engine->reap_runners();
    }
    REQUIRE(retained == 0);
    REQUIRE(h.engine->list_jobs(JobStatus::COMPLETED).size() == 50);
}

TEST_CASE("Terminal jobs can be released from memory", "[engine][memory]") {
    Harness h;
    h.catalog.register_workflow(article_workflow("pausing", "echo"));

    JobId done = h.engine->create_job("article");
    REQUIRE(h.engine->execute_job(done) == JobStatus::COMPLETED);

    h.pause_armed = true;
    JobId paused = h.engine->create_job("article");
    REQUIRE(h.engine->execute_job(paused) == JobStatus::PAUSED);

    REQUIRE_THROWS_AS(h.engine->forget_job(paused), InvalidTransition);
    REQUIRE_THROWS_AS(h.engine->forget_job("job_unknown"), JobNotFound);
    REQUIRE(h.bus.tracked_job_count() == 2);

    h.engine->forget_job(done);
    REQUIRE_THROWS_AS(h.engine->get_job(done), JobNotFound);
    REQUIRE(h.bus.history(done).empty());
    REQUIRE(h.bus.tracked_job_count() == 1);
    REQUIRE(h.engine->list_jobs() == std::vector<JobId>{paused});

    // checkpoints outlive the in-memory slot
    REQUIRE(h.engine->recover_job(done) == done);
    REQUIRE(h.engine->get_status(done).current_level == 2);
    REQUIRE(h.engine->resume_job(done) == JobStatus::COMPLETED);
    REQUIRE(h.engine->get_job(done).outputs.size() == 3);
}

TEST_CASE("Per-job subscriptions see only that job", "[engine][events]") {
    Harness h;
    h.catalog.register_workflow(article_workflow());

    JobId first = h.engine->create_job("article");
    JobId second = h.engine->create_job("article");

    std::vector<JobId> seen;
    auto handle = h.engine->subscribe(first, [&](const Event& e) { seen.push_back(e.job_id); },
                                      {EventType::JOB_COMPLETED, EventType::LEVEL_COMPLETED});
    h.engine->execute_job(first);
    h.engine->execute_job(second);

    REQUIRE(seen.size() == 3);
    REQUIRE(std::all_of(seen.begin(), seen.end(), [&](const JobId& id) { return id == first; }));
    REQUIRE(h.engine->unsubscribe(handle));
}
