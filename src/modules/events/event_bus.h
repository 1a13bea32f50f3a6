// modules/events/event_bus.h
#ifndef UCOP_MODULES_EVENTS_EVENT_BUS_H
#define UCOP_MODULES_EVENTS_EVENT_BUS_H

#include "core/types/event.h"
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ucop {

using EventHandler = std::function<void(const Event&)>;
using SubscriptionHandle = uint64_t;

// In-process publish/subscribe. Delivery is synchronous in the publisher's
// thread and serialized across publishers, so every subscriber sees one job's
// events in emission order. Subscribers only see events published after they
// subscribed; history() replays what is still retained.
class EventBus {
public:
    explicit EventBus(size_t history_limit = 1000);

    SubscriptionHandle subscribe(EventFilter filter, EventHandler handler);
    bool unsubscribe(SubscriptionHandle handle);

    // Assigns the per-job sequence number (and timestamp if unset), then delivers
    void publish(Event event);

    std::vector<Event> history(const JobId& job_id) const;
    void clear_history(const JobId& job_id);

    // Drops the job's history and sequence counter
    void forget_job(const JobId& job_id);
    size_t tracked_job_count() const;

    size_t subscriber_count() const;
    size_t history_limit() const { return history_limit_; }

private:
    struct Subscription {
        EventFilter filter;
        EventHandler handler;
    };

    const size_t history_limit_;

    std::recursive_mutex dispatch_mutex_;   // handlers may publish follow-up events
    mutable std::mutex state_mutex_;
    std::map<SubscriptionHandle, Subscription> subscribers_;
    SubscriptionHandle next_handle_ = 1;
    std::unordered_map<JobId, uint64_t> sequences_;
    std::unordered_map<JobId, std::deque<Event>> history_;
};

} // namespace ucop

#endif // UCOP_MODULES_EVENTS_EVENT_BUS_H
