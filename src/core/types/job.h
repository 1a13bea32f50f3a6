#ifndef UCOP_CORE_TYPES_JOB_H
#define UCOP_CORE_TYPES_JOB_H

#include "context.h"
#include "errors.h"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace ucop {

enum class JobStatus : uint8_t {
    PENDING,
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED,
    CANCELLED
};

inline const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING: return "pending";
        case JobStatus::RUNNING: return "running";
        case JobStatus::PAUSED: return "paused";
        case JobStatus::COMPLETED: return "completed";
        case JobStatus::FAILED: return "failed";
        case JobStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline std::optional<JobStatus> job_status_from_string(std::string_view name) {
    if (name == "pending") return JobStatus::PENDING;
    if (name == "running") return JobStatus::RUNNING;
    if (name == "paused") return JobStatus::PAUSED;
    if (name == "completed") return JobStatus::COMPLETED;
    if (name == "failed") return JobStatus::FAILED;
    if (name == "cancelled") return JobStatus::CANCELLED;
    return std::nullopt;
}

inline bool is_terminal(JobStatus status) {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED || status == JobStatus::CANCELLED;
}

// Legal edges of the job state machine
inline bool can_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::PENDING:
            return to == JobStatus::RUNNING || to == JobStatus::CANCELLED;
        case JobStatus::RUNNING:
            return to == JobStatus::PAUSED || to == JobStatus::COMPLETED ||
                   to == JobStatus::FAILED || to == JobStatus::CANCELLED;
        case JobStatus::PAUSED:
            return to == JobStatus::RUNNING || to == JobStatus::CANCELLED;
        default:
            return false;
    }
}

enum class StepOutcome : uint8_t {
    SUCCEEDED,
    FAILED,
    TIMED_OUT
};

inline const char* to_string(StepOutcome outcome) {
    switch (outcome) {
        case StepOutcome::SUCCEEDED: return "succeeded";
        case StepOutcome::FAILED: return "failed";
        case StepOutcome::TIMED_OUT: return "timed_out";
    }
    return "unknown";
}

enum class StepStatus : uint8_t {
    COMPLETED,
    FAILED,
    TIMED_OUT,
    SKIPPED
};

inline const char* to_string(StepStatus status) {
    switch (status) {
        case StepStatus::COMPLETED: return "completed";
        case StepStatus::FAILED: return "failed";
        case StepStatus::TIMED_OUT: return "timed_out";
        case StepStatus::SKIPPED: return "skipped";
    }
    return "unknown";
}

struct StepFailure {
    std::string error;
    ErrorCode code = ErrorCode::STEP_FAILURE;   // STEP_FAILURE or STEP_TIMEOUT

    bool operator==(const StepFailure&) const = default;
};

struct StepRecord {
    StepId step_id;
    StepStatus status = StepStatus::COMPLETED;
    int attempts = 0;
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> finished_at;
    std::optional<std::string> error;

    std::chrono::milliseconds duration() const {
        if (!started_at || !finished_at) return std::chrono::milliseconds{0};
        return std::chrono::duration_cast<std::chrono::milliseconds>(*finished_at - *started_at);
    }
};

struct Job {
    JobId id;
    std::string workflow_id;
    std::string workflow_version;
    JobStatus status = JobStatus::PENDING;
    size_t current_level = 0;                  // next level to dispatch
    Context inputs = Context::object();

    std::set<StepId> completed_steps;
    std::map<StepId, StepFailure> failed_steps;
    std::set<StepId> skipped_steps;
    std::map<StepId, Value> outputs;
    std::map<StepId, StepRecord> step_records;

    Timestamp created_at;
    Timestamp updated_at;
    std::optional<std::string> error_message;
    std::optional<CheckpointId> restored_from;
};

struct JobStatusReport {
    JobStatus status = JobStatus::PENDING;
    size_t completed_step_count = 0;
    size_t total_step_count = 0;
    size_t current_level = 0;
    size_t level_count = 0;
    size_t failed_step_count = 0;
    size_t skipped_step_count = 0;
    std::optional<std::string> error_message;
};

inline nlohmann::json to_json(const JobStatusReport& report) {
    nlohmann::json j = {
        {"status", to_string(report.status)},
        {"completed_step_count", report.completed_step_count},
        {"total_step_count", report.total_step_count},
        {"current_level", report.current_level},
        {"level_count", report.level_count},
        {"failed_step_count", report.failed_step_count},
        {"skipped_step_count", report.skipped_step_count}
    };
    if (report.error_message) {
        j["error_message"] = *report.error_message;
    }
    return j;
}

} // namespace ucop

#endif // UCOP_CORE_TYPES_JOB_H
