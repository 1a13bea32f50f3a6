// core/engine.h
#ifndef UCOP_CORE_ENGINE_H
#define UCOP_CORE_ENGINE_H

#include "core/types/checkpoint.h"
#include "core/types/event.h"
#include "core/types/job.h"
#include "core/types/workflow.h"
#include "common/config/engine_config.h"
#include "common/steps/step_registry.h"
#include "modules/checkpoint/checkpoint_manager.h"
#include "modules/compiler/workflow_catalog.h"
#include "modules/events/event_bus.h"
#include "modules/executor/parallel_executor.h"
#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace ucop {

// Owns every job's lifecycle and drives its compiled graph level by level:
// the executor runs a level, the engine records the results, persists a
// checkpoint and announces progress on the event bus.
//
// Pause and cancel requests are only honoured between levels; a level that
// has been dispatched always runs to completion first.
class JobExecutionEngine {
public:
    JobExecutionEngine(WorkflowCatalog& catalog,
                       const StepRegistry& registry,
                       CheckpointManager& checkpoints,
                       EventBus& events,
                       EngineConfig config = {});
    ~JobExecutionEngine();

    JobExecutionEngine(const JobExecutionEngine&) = delete;
    JobExecutionEngine& operator=(const JobExecutionEngine&) = delete;

    // Throws WorkflowNotFound
    JobId create_job(const std::string& workflow_id, Context inputs = Context::object());

    // pending -> running -> {paused, completed, failed, cancelled}; returns where it stopped
    JobStatus execute_job(const JobId& job_id);
    std::future<JobStatus> execute_job_async(const JobId& job_id);

    // Joins async runners whose job has returned; returns how many are still retained
    size_t reap_runners();

    void pause_job(const JobId& job_id);

    // paused -> running. With a checkpoint id the job state is replaced by
    // that checkpoint's snapshot first.
    JobStatus resume_job(const JobId& job_id, const std::optional<CheckpointId>& checkpoint_id = std::nullopt);

    void cancel_job(const JobId& job_id);

    // Reloads a job that is not in memory from its checkpoints; the job comes back paused
    JobId recover_job(const JobId& job_id, const std::optional<CheckpointId>& checkpoint_id = std::nullopt);

    JobStatusReport get_status(const JobId& job_id) const;
    Job get_job(const JobId& job_id) const;
    std::vector<JobId> list_jobs(std::optional<JobStatus> status = std::nullopt) const;

    std::vector<Checkpoint> list_checkpoints(const JobId& job_id) const;
    CleanupResult cleanup_checkpoints(const JobId& job_id, size_t keep_last);

    SubscriptionHandle subscribe(const JobId& job_id, EventHandler handler, std::set<EventType> types = {});
    bool unsubscribe(SubscriptionHandle handle);

    // Drops a terminal job from memory together with its event history.
    // Its checkpoints stay on disk, so recover_job can bring it back.
    void forget_job(const JobId& job_id);

    const EngineConfig& config() const { return config_; }

private:
    struct JobSlot {
        Job job;
        std::shared_ptr<const CompiledGraph> graph;
        std::atomic<bool> pause_requested{false};
        std::atomic<bool> cancel_requested{false};
        int drivers = 0;                                // execute/resume calls still inside drive()
    };

    struct Runner {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    WorkflowCatalog& catalog_;
    CheckpointManager& checkpoints_;
    EventBus& events_;
    EngineConfig config_;
    ParallelExecutor executor_;

    mutable std::mutex mutex_;                          // guards jobs_ and every Job inside
    std::map<JobId, std::unique_ptr<JobSlot>> jobs_;    // erased only by forget_job

    std::mutex runners_mutex_;
    std::vector<Runner> runners_;

    size_t reap_runners_locked();

    JobSlot& slot_locked(const JobId& job_id) const;
    JobSnapshot snapshot_locked(const JobSlot& slot) const;

    JobStatus drive(JobSlot& slot);
    JobStatus run_levels(JobSlot& slot);
    void apply_level_result(JobSlot& slot, const LevelResult& results, std::vector<Event>& step_events,
                            std::vector<StepId>& fatal_failures);
    JobStatus finish(JobSlot& slot, JobStatus status, std::optional<std::string> error = std::nullopt);

    std::optional<CheckpointId> save_checkpoint(const JobId& job_id, const JobSnapshot& snapshot, const std::string& marker = {});
    void publish(EventType type, const JobId& job_id, nlohmann::json payload = nlohmann::json::object(),
                 std::optional<StepId> step_id = std::nullopt);

    static void restore_into(Job& job, const CompiledGraph& graph, const JobSnapshot& snapshot, const CheckpointId& checkpoint_id);
};

} // namespace ucop

#endif // UCOP_CORE_ENGINE_H
