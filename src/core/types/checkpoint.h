#ifndef UCOP_CORE_TYPES_CHECKPOINT_H
#define UCOP_CORE_TYPES_CHECKPOINT_H

#include "context.h"
#include "job.h"
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace ucop {

// Everything needed to rebuild a job at a level boundary
struct JobSnapshot {
    std::string workflow_id;
    std::string workflow_version;
    JobStatus status = JobStatus::RUNNING;
    size_t next_level = 0;
    Context inputs = Context::object();
    std::set<StepId> completed_steps;
    std::map<StepId, StepFailure> failed_steps;
    std::set<StepId> skipped_steps;
    std::map<StepId, Value> outputs;
};

struct Checkpoint {
    CheckpointId id;
    JobId job_id;
    std::string marker;          // e.g. "level_2", "cancelled"
    Timestamp created_at;
    uint64_t sequence = 0;       // per job, breaks timestamp ties
    JobSnapshot snapshot;
};

struct CleanupResult {
    size_t kept = 0;
    size_t deleted = 0;
};

} // namespace ucop

#endif // UCOP_CORE_TYPES_CHECKPOINT_H
