// core/engine.cpp
#include "core/engine.h"
#include "modules/context/context_engine.h"
#include "common/utils/logging.h"
#include "common/utils/time_utils.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace ucop {

namespace {

ExecutorConfig executor_config(const EngineConfig& config) {
    ExecutorConfig exec;
    exec.max_concurrency = config.max_concurrency;
    exec.retry_backoff = config.step_retry_backoff;
    exec.default_timeout = config.default_step_timeout;
    return exec;
}

Event make_event(EventType type, const JobId& job_id, nlohmann::json payload, std::optional<StepId> step_id = std::nullopt) {
    Event event;
    event.type = type;
    event.job_id = job_id;
    event.step_id = std::move(step_id);
    event.payload = std::move(payload);
    return event;
}

} // namespace

JobExecutionEngine::JobExecutionEngine(WorkflowCatalog& catalog,
                                       const StepRegistry& registry,
                                       CheckpointManager& checkpoints,
                                       EventBus& events,
                                       EngineConfig config)
    : catalog_(catalog),
      checkpoints_(checkpoints),
      events_(events),
      config_(std::move(config)),
      executor_(registry, executor_config(config_)) {}

JobExecutionEngine::~JobExecutionEngine() {
    std::vector<Runner> runners;
    {
        std::lock_guard<std::mutex> lock(runners_mutex_);
        runners.swap(runners_);
    }
    for (auto& runner : runners) {
        if (runner.thread.joinable()) {
            runner.thread.join();
        }
    }
}

// ————————————————————————
// Lifecycle operations
// ————————————————————————

JobId JobExecutionEngine::create_job(const std::string& workflow_id, Context inputs) {
    if (!inputs.is_null() && !inputs.is_object()) {
        throw std::invalid_argument("Job inputs must be a JSON object");
    }
    auto graph = catalog_.get(workflow_id);

    auto slot = std::make_unique<JobSlot>();
    Job& job = slot->job;
    job.id = generate_id("job");
    job.workflow_id = graph->workflow_id;
    job.workflow_version = graph->version;
    job.status = JobStatus::PENDING;
    job.inputs = inputs.is_null() ? Context::object() : std::move(inputs);
    job.created_at = job.updated_at = now();
    slot->graph = std::move(graph);

    JobId job_id = job.id;
    nlohmann::json payload = {
        {"workflow_id", job.workflow_id},
        {"workflow_version", job.workflow_version},
        {"level_count", slot->graph->level_count()},
        {"step_count", slot->graph->step_count()}
    };
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.emplace(job_id, std::move(slot));
    }

    log_info("engine", "Created job " + job_id + " for workflow '" + workflow_id + "'");
    publish(EventType::JOB_CREATED, job_id, std::move(payload));
    return job_id;
}

JobStatus JobExecutionEngine::execute_job(const JobId& job_id) {
    JobSlot* slot = nullptr;
    size_t level = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot = &slot_locked(job_id);
        if (slot->job.status != JobStatus::PENDING) {
            throw InvalidTransition("Cannot execute job " + job_id + " in status " + to_string(slot->job.status));
        }
        slot->job.status = JobStatus::RUNNING;
        slot->job.updated_at = now();
        ++slot->drivers;
        level = slot->job.current_level;
    }

    log_info("engine", "Job " + job_id + " started");
    publish(EventType::JOB_STARTED, job_id, {{"level", level}});
    return drive(*slot);
}

std::future<JobStatus> JobExecutionEngine::execute_job_async(const JobId& job_id) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::packaged_task<JobStatus()> task([this, job_id] { return execute_job(job_id); });
    std::future<JobStatus> result = task.get_future();

    std::lock_guard<std::mutex> lock(runners_mutex_);
    reap_runners_locked();
    std::thread thread([task = std::move(task), done]() mutable {
        task();
        done->store(true);
    });
    runners_.push_back(Runner{std::move(thread), std::move(done)});
    return result;
}

size_t JobExecutionEngine::reap_runners() {
    std::lock_guard<std::mutex> lock(runners_mutex_);
    return reap_runners_locked();
}

size_t JobExecutionEngine::reap_runners_locked() {
    auto finished = std::partition(runners_.begin(), runners_.end(),
                                   [](const Runner& runner) { return !runner.done->load(); });
    for (auto it = finished; it != runners_.end(); ++it) {
        it->thread.join();
    }
    runners_.erase(finished, runners_.end());
    return runners_.size();
}

void JobExecutionEngine::pause_job(const JobId& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    JobSlot& slot = slot_locked(job_id);
    if (slot.job.status != JobStatus::RUNNING) {
        throw InvalidTransition("Cannot pause job " + job_id + " in status " + to_string(slot.job.status));
    }
    slot.pause_requested = true;
    log_info("engine", "Pause requested for job " + job_id);
}

JobStatus JobExecutionEngine::resume_job(const JobId& job_id, const std::optional<CheckpointId>& checkpoint_id) {
    std::shared_ptr<const CompiledGraph> graph;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const JobSlot& slot = slot_locked(job_id);
        if (slot.job.status != JobStatus::PAUSED) {
            throw InvalidTransition("Cannot resume job " + job_id + " in status " + to_string(slot.job.status));
        }
        graph = slot.graph;
    }

    std::optional<JobSnapshot> restored;
    if (checkpoint_id) {
        Checkpoint checkpoint = checkpoints_.get(*checkpoint_id);
        if (checkpoint.job_id != job_id) {
            throw CheckpointNotFound("Checkpoint " + *checkpoint_id + " does not belong to job " + job_id);
        }
        CheckpointManager::check_compatibility(checkpoint, *graph);
        restored = std::move(checkpoint.snapshot);
    }

    JobSlot* slot = nullptr;
    size_t level = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        slot = &slot_locked(job_id);
        Job& job = slot->job;
        // another thread may have resumed or cancelled meanwhile
        if (job.status != JobStatus::PAUSED) {
            throw InvalidTransition("Cannot resume job " + job_id + " in status " + to_string(job.status));
        }
        if (restored) {
            restore_into(job, *slot->graph, *restored, *checkpoint_id);
        }
        job.status = JobStatus::RUNNING;
        job.updated_at = now();
        slot->pause_requested = false;
        slot->cancel_requested = false;
        ++slot->drivers;
        level = job.current_level;
    }

    log_info("engine", "Job " + job_id + " resumed at level " + std::to_string(level) +
                           (checkpoint_id ? " from checkpoint " + *checkpoint_id : std::string{}));
    nlohmann::json payload = {{"level", level}};
    if (checkpoint_id) {
        payload["checkpoint_id"] = *checkpoint_id;
    }
    publish(EventType::JOB_RESUMED, job_id, std::move(payload));
    return drive(*slot);
}

void JobExecutionEngine::cancel_job(const JobId& job_id) {
    JobStatus previous;
    std::optional<JobSnapshot> final_snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobSlot& slot = slot_locked(job_id);
        Job& job = slot.job;
        previous = job.status;
        switch (job.status) {
            case JobStatus::RUNNING:
                // the running level finishes first, run_levels does the rest
                slot.cancel_requested = true;
                log_info("engine", "Cancel requested for job " + job_id);
                return;
            case JobStatus::PENDING:
                break;
            case JobStatus::PAUSED:
                final_snapshot = snapshot_locked(slot);
                final_snapshot->status = JobStatus::CANCELLED;
                break;
            default:
                throw InvalidTransition("Cannot cancel job " + job_id + " in status " + to_string(job.status));
        }
        job.status = JobStatus::CANCELLED;
        job.updated_at = now();
    }

    if (final_snapshot) {
        save_checkpoint(job_id, *final_snapshot, "cancelled");
    }
    log_info("engine", "Job " + job_id + " cancelled while " + to_string(previous));
    publish(EventType::JOB_CANCELLED, job_id, {{"from", to_string(previous)}});
}

JobId JobExecutionEngine::recover_job(const JobId& job_id, const std::optional<CheckpointId>& checkpoint_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (jobs_.count(job_id)) {
            throw InvalidTransition("Job " + job_id + " is already loaded");
        }
    }

    Checkpoint checkpoint;
    if (checkpoint_id) {
        checkpoint = checkpoints_.get(*checkpoint_id);
        if (checkpoint.job_id != job_id) {
            throw CheckpointNotFound("Checkpoint " + *checkpoint_id + " does not belong to job " + job_id);
        }
    } else {
        auto latest = checkpoints_.latest(job_id);
        if (!latest) {
            throw CheckpointNotFound("No checkpoints stored for job " + job_id);
        }
        checkpoint = std::move(*latest);
    }

    auto graph = catalog_.get(checkpoint.snapshot.workflow_id);
    CheckpointManager::check_compatibility(checkpoint, *graph);

    auto slot = std::make_unique<JobSlot>();
    Job& job = slot->job;
    job.id = job_id;
    job.workflow_id = graph->workflow_id;
    job.workflow_version = graph->version;
    job.created_at = checkpoint.created_at;
    job.updated_at = now();
    restore_into(job, *graph, checkpoint.snapshot, checkpoint.id);
    job.status = is_terminal(checkpoint.snapshot.status) ? checkpoint.snapshot.status : JobStatus::PAUSED;
    slot->graph = std::move(graph);

    nlohmann::json payload = {
        {"checkpoint_id", checkpoint.id},
        {"status", to_string(job.status)},
        {"level", job.current_level}
    };
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!jobs_.emplace(job_id, std::move(slot)).second) {
            throw InvalidTransition("Job " + job_id + " is already loaded");
        }
    }

    log_info("engine", "Recovered job " + job_id + " from checkpoint " + checkpoint.id);
    publish(EventType::JOB_RECOVERED, job_id, std::move(payload));
    return job_id;
}

void JobExecutionEngine::forget_job(const JobId& job_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        JobSlot& slot = slot_locked(job_id);
        if (!is_terminal(slot.job.status) || slot.drivers > 0) {
            throw InvalidTransition("Cannot forget job " + job_id + " in status " + to_string(slot.job.status));
        }
        jobs_.erase(job_id);
    }
    events_.forget_job(job_id);
    log_debug("engine", "Job " + job_id + " released from memory");
}

// ————————————————————————
// Queries
// ————————————————————————

JobStatusReport JobExecutionEngine::get_status(const JobId& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const JobSlot& slot = slot_locked(job_id);
    const Job& job = slot.job;

    JobStatusReport report;
    report.status = job.status;
    report.completed_step_count = job.completed_steps.size();
    report.total_step_count = slot.graph->step_count();
    report.current_level = job.current_level;
    report.level_count = slot.graph->level_count();
    report.failed_step_count = job.failed_steps.size();
    report.skipped_step_count = job.skipped_steps.size();
    report.error_message = job.error_message;
    return report;
}

Job JobExecutionEngine::get_job(const JobId& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slot_locked(job_id).job;
}

std::vector<JobId> JobExecutionEngine::list_jobs(std::optional<JobStatus> status) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<JobId> ids;
    for (const auto& [id, slot] : jobs_) {
        if (!status || slot->job.status == *status) {
            ids.push_back(id);
        }
    }
    return ids;
}

std::vector<Checkpoint> JobExecutionEngine::list_checkpoints(const JobId& job_id) const {
    return checkpoints_.list(job_id);
}

CleanupResult JobExecutionEngine::cleanup_checkpoints(const JobId& job_id, size_t keep_last) {
    return checkpoints_.cleanup(job_id, keep_last);
}

SubscriptionHandle JobExecutionEngine::subscribe(const JobId& job_id, EventHandler handler, std::set<EventType> types) {
    EventFilter filter;
    filter.job_id = job_id;
    filter.types = std::move(types);
    return events_.subscribe(std::move(filter), std::move(handler));
}

bool JobExecutionEngine::unsubscribe(SubscriptionHandle handle) {
    return events_.unsubscribe(handle);
}

// ————————————————————————
// Level loop
// ————————————————————————

// Releases the slot once the run has stopped, so forget_job may free it
JobStatus JobExecutionEngine::drive(JobSlot& slot) {
    JobStatus status;
    try {
        status = run_levels(slot);
    } catch (const std::exception& e) {
        log_error("engine", "Job " + slot.job.id + " aborted: " + e.what());
        status = finish(slot, JobStatus::FAILED, std::string("Engine error: ") + e.what());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    --slot.drivers;
    return status;
}

JobStatus JobExecutionEngine::run_levels(JobSlot& slot) {
    const JobId job_id = slot.job.id;
    const CompiledGraph& graph = *slot.graph;
    const ContextEngine context_engine(ContextMergePolicy::from_json(graph.merge_policy));

    enum class Boundary { DISPATCH, COMPLETE, PAUSE, CANCEL };

    for (;;) {
        Boundary boundary = Boundary::DISPATCH;
        size_t level = 0;
        std::vector<StepId> dispatch;
        Context inputs;
        std::map<StepId, Value> outputs;
        JobSnapshot boundary_snapshot;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            Job& job = slot.job;
            if (job.current_level >= graph.level_count()) {
                boundary = Boundary::COMPLETE;
            } else if (slot.cancel_requested.load()) {
                boundary = Boundary::CANCEL;
                job.status = JobStatus::CANCELLED;
                job.updated_at = now();
                boundary_snapshot = snapshot_locked(slot);
            } else if (slot.pause_requested.exchange(false)) {
                boundary = Boundary::PAUSE;
                job.status = JobStatus::PAUSED;
                job.updated_at = now();
                boundary_snapshot = snapshot_locked(slot);
            } else {
                level = job.current_level;
                for (const auto& id : graph.levels[level]) {
                    if (!job.skipped_steps.count(id) && !job.completed_steps.count(id) && !job.failed_steps.count(id)) {
                        dispatch.push_back(id);
                    }
                }
                inputs = job.inputs;
                outputs = job.outputs;
            }
        }

        switch (boundary) {
            case Boundary::COMPLETE:
                return finish(slot, JobStatus::COMPLETED);
            case Boundary::CANCEL:
                save_checkpoint(job_id, boundary_snapshot, "cancelled");
                log_info("engine", "Job " + job_id + " cancelled at level " + std::to_string(boundary_snapshot.next_level));
                publish(EventType::JOB_CANCELLED, job_id, {{"from", "running"}, {"level", boundary_snapshot.next_level}});
                return JobStatus::CANCELLED;
            case Boundary::PAUSE:
                save_checkpoint(job_id, boundary_snapshot, "paused");
                log_info("engine", "Job " + job_id + " paused at level " + std::to_string(boundary_snapshot.next_level));
                publish(EventType::JOB_PAUSED, job_id, {{"level", boundary_snapshot.next_level}});
                return JobStatus::PAUSED;
            case Boundary::DISPATCH:
                break;
        }

        Context view = context_engine.build_view(job_id, inputs, outputs, graph);
        ContextEngine::fill_missing_dependencies(view, graph, dispatch);

        publish(EventType::LEVEL_STARTED, job_id, {{"level", level}, {"steps", dispatch}});
        log_debug("engine", "Job " + job_id + " dispatching level " + std::to_string(level) +
                                " (" + std::to_string(dispatch.size()) + " steps)");

        LevelResult results = executor_.execute_level(graph, dispatch, std::make_shared<const Context>(std::move(view)), job_id);

        std::vector<Event> step_events;
        std::vector<StepId> fatal_failures;
        JobSnapshot level_snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            apply_level_result(slot, results, step_events, fatal_failures);
            slot.job.current_level = level + 1;
            slot.job.updated_at = now();
            level_snapshot = snapshot_locked(slot);
            if (!fatal_failures.empty()) {
                level_snapshot.status = JobStatus::FAILED;
            }
        }

        for (auto& event : step_events) {
            events_.publish(std::move(event));
        }

        save_checkpoint(job_id, level_snapshot);

        size_t succeeded = std::count_if(results.begin(), results.end(),
                                         [](const auto& entry) { return entry.second.succeeded(); });
        publish(EventType::LEVEL_COMPLETED, job_id, {
            {"level", level},
            {"succeeded", succeeded},
            {"failed", results.size() - succeeded}
        });

        if (!fatal_failures.empty()) {
            std::string message = "Step(s) failed: ";
            for (size_t i = 0; i < fatal_failures.size(); ++i) {
                message += (i ? ", " : "") + fatal_failures[i];
            }
            return finish(slot, JobStatus::FAILED, message);
        }
    }
}

// Called with mutex_ held
void JobExecutionEngine::apply_level_result(JobSlot& slot, const LevelResult& results, std::vector<Event>& step_events,
                                            std::vector<StepId>& fatal_failures) {
    Job& job = slot.job;
    const CompiledGraph& graph = *slot.graph;

    for (const auto& [id, result] : results) {
        StepRecord record;
        record.step_id = id;
        record.attempts = result.attempts;
        record.started_at = result.started_at;
        record.finished_at = result.finished_at;
        record.error = result.error;

        const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(result.finished_at - result.started_at).count();

        if (result.succeeded()) {
            record.status = StepStatus::COMPLETED;
            job.outputs[id] = result.output;
            job.completed_steps.insert(id);
            job.step_records[id] = std::move(record);
            step_events.push_back(make_event(EventType::STEP_COMPLETED, job.id,
                                             {{"attempts", result.attempts}, {"duration_ms", duration_ms}}, id));
            continue;
        }

        const bool timed_out = result.outcome == StepOutcome::TIMED_OUT;
        record.status = timed_out ? StepStatus::TIMED_OUT : StepStatus::FAILED;
        job.step_records[id] = std::move(record);

        StepFailure failure;
        failure.error = result.error.value_or("unknown error");
        failure.code = timed_out ? ErrorCode::STEP_TIMEOUT : ErrorCode::STEP_FAILURE;
        job.failed_steps[id] = failure;

        const bool continue_on_error = graph.step(id).spec.continue_on_error;
        step_events.push_back(make_event(EventType::STEP_FAILED, job.id, {
            {"error", failure.error},
            {"code", to_string(failure.code)},
            {"outcome", to_string(result.outcome)},
            {"attempts", result.attempts},
            {"continue_on_error", continue_on_error}
        }, id));

        if (!continue_on_error) {
            fatal_failures.push_back(id);
            continue;
        }

        for (const auto& dependent : graph.transitive_dependents(id)) {
            if (job.completed_steps.count(dependent) || !job.skipped_steps.insert(dependent).second) {
                continue;
            }
            StepRecord skipped;
            skipped.step_id = dependent;
            skipped.status = StepStatus::SKIPPED;
            job.step_records[dependent] = std::move(skipped);
            step_events.push_back(make_event(EventType::STEP_SKIPPED, job.id, {{"failed_dependency", id}}, dependent));
        }
    }
}

JobStatus JobExecutionEngine::finish(JobSlot& slot, JobStatus status, std::optional<std::string> error) {
    JobId job_id;
    size_t completed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Job& job = slot.job;
        job.status = status;
        job.error_message = error;
        job.updated_at = now();
        job_id = job.id;
        completed = job.completed_steps.size();
    }

    nlohmann::json payload = {{"completed_steps", completed}};
    if (status == JobStatus::COMPLETED) {
        log_info("engine", "Job " + job_id + " completed");
        publish(EventType::JOB_COMPLETED, job_id, std::move(payload));
    } else {
        payload["error"] = error.value_or("");
        log_error("engine", "Job " + job_id + " failed: " + error.value_or(""));
        publish(EventType::JOB_FAILED, job_id, std::move(payload));
    }
    return status;
}

// ————————————————————————
// Helpers
// ————————————————————————

JobExecutionEngine::JobSlot& JobExecutionEngine::slot_locked(const JobId& job_id) const {
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) {
        throw JobNotFound(job_id);
    }
    return *it->second;
}

JobSnapshot JobExecutionEngine::snapshot_locked(const JobSlot& slot) const {
    const Job& job = slot.job;
    JobSnapshot snapshot;
    snapshot.workflow_id = job.workflow_id;
    snapshot.workflow_version = job.workflow_version;
    snapshot.status = job.status;
    snapshot.next_level = job.current_level;
    snapshot.inputs = job.inputs;
    snapshot.completed_steps = job.completed_steps;
    snapshot.failed_steps = job.failed_steps;
    snapshot.skipped_steps = job.skipped_steps;
    snapshot.outputs = job.outputs;
    return snapshot;
}

std::optional<CheckpointId> JobExecutionEngine::save_checkpoint(const JobId& job_id, const JobSnapshot& snapshot, const std::string& marker) {
    const int attempts = std::max(1, config_.checkpoint_save_attempts);
    auto backoff = config_.checkpoint_retry_backoff;
    std::string last_error;

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::optional<CheckpointId> saved;
        try {
            saved = checkpoints_.save(job_id, snapshot, marker);
        } catch (const std::exception& e) {
            last_error = e.what();
            log_warning("engine", "Checkpoint save for job " + job_id + " failed (attempt " +
                                      std::to_string(attempt) + "/" + std::to_string(attempts) + "): " + last_error);
        }

        if (saved) {
            publish(EventType::CHECKPOINT_SAVED, job_id, {
                {"checkpoint_id", *saved},
                {"next_level", snapshot.next_level},
                {"attempts", attempt}
            });
            if (config_.checkpoint_keep_last > 0) {
                try {
                    checkpoints_.cleanup(job_id, config_.checkpoint_keep_last);
                } catch (const std::exception& e) {
                    log_warning("engine", "Checkpoint cleanup for job " + job_id + " failed: " + e.what());
                }
            }
            return saved;
        }

        if (attempt < attempts && backoff.count() > 0) {
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }
    }

    log_warning("engine", "Giving up on checkpoint for job " + job_id + " at level " + std::to_string(snapshot.next_level));
    publish(EventType::CHECKPOINT_FAILED, job_id, {
        {"next_level", snapshot.next_level},
        {"error", last_error},
        {"attempts", attempts}
    });
    return std::nullopt;
}

void JobExecutionEngine::publish(EventType type, const JobId& job_id, nlohmann::json payload, std::optional<StepId> step_id) {
    events_.publish(make_event(type, job_id, std::move(payload), std::move(step_id)));
}

// Failed steps keep their dependents skipped, whatever their continue_on_error said
void JobExecutionEngine::restore_into(Job& job, const CompiledGraph& graph, const JobSnapshot& snapshot, const CheckpointId& checkpoint_id) {
    job.inputs = snapshot.inputs;
    job.current_level = snapshot.next_level;
    job.completed_steps = snapshot.completed_steps;
    job.failed_steps = snapshot.failed_steps;
    job.skipped_steps = snapshot.skipped_steps;
    job.outputs = snapshot.outputs;
    job.error_message.reset();
    job.restored_from = checkpoint_id;

    for (const auto& [failed, _] : snapshot.failed_steps) {
        for (const auto& dependent : graph.transitive_dependents(failed)) {
            if (!job.completed_steps.count(dependent)) {
                job.skipped_steps.insert(dependent);
            }
        }
    }

    for (auto it = job.step_records.begin(); it != job.step_records.end();) {
        const StepId& id = it->first;
        bool known = job.completed_steps.count(id) || job.failed_steps.count(id) || job.skipped_steps.count(id);
        it = known ? std::next(it) : job.step_records.erase(it);
    }
}

} // namespace ucop
