#ifndef UCOP_CORE_TYPES_EVENT_H
#define UCOP_CORE_TYPES_EVENT_H

#include "context.h"
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace ucop {

enum class EventType : uint8_t {
    JOB_CREATED,
    JOB_STARTED,
    JOB_PAUSED,
    JOB_RESUMED,
    JOB_COMPLETED,
    JOB_FAILED,
    JOB_CANCELLED,
    JOB_RECOVERED,
    LEVEL_STARTED,
    LEVEL_COMPLETED,
    STEP_COMPLETED,
    STEP_FAILED,
    STEP_SKIPPED,
    CHECKPOINT_SAVED,
    CHECKPOINT_FAILED   // warning: save retries exhausted
};

inline const char* to_string(EventType type) {
    switch (type) {
        case EventType::JOB_CREATED: return "job_created";
        case EventType::JOB_STARTED: return "job_started";
        case EventType::JOB_PAUSED: return "job_paused";
        case EventType::JOB_RESUMED: return "job_resumed";
        case EventType::JOB_COMPLETED: return "job_completed";
        case EventType::JOB_FAILED: return "job_failed";
        case EventType::JOB_CANCELLED: return "job_cancelled";
        case EventType::JOB_RECOVERED: return "job_recovered";
        case EventType::LEVEL_STARTED: return "level_started";
        case EventType::LEVEL_COMPLETED: return "level_completed";
        case EventType::STEP_COMPLETED: return "step_completed";
        case EventType::STEP_FAILED: return "step_failed";
        case EventType::STEP_SKIPPED: return "step_skipped";
        case EventType::CHECKPOINT_SAVED: return "checkpoint_saved";
        case EventType::CHECKPOINT_FAILED: return "checkpoint_failed";
    }
    return "unknown";
}

struct Event {
    EventType type = EventType::JOB_CREATED;
    JobId job_id;
    std::optional<StepId> step_id;
    nlohmann::json payload = nlohmann::json::object();
    Timestamp timestamp{};        // stamped on publish when left default
    uint64_t sequence = 0;        // per job, assigned on publish
};

struct EventFilter {
    std::optional<JobId> job_id;
    std::set<EventType> types;    // empty = every type

    bool matches(const Event& event) const {
        if (job_id && *job_id != event.job_id) return false;
        return types.empty() || types.count(event.type) > 0;
    }
};

} // namespace ucop

#endif // UCOP_CORE_TYPES_EVENT_H
