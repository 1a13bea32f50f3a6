// modules/events/event_bus.cpp
#include "modules/events/event_bus.h"
#include "common/utils/logging.h"
#include "common/utils/time_utils.h"
#include <stdexcept>
#include <utility>

namespace ucop {

EventBus::EventBus(size_t history_limit)
    : history_limit_(history_limit) {}

SubscriptionHandle EventBus::subscribe(EventFilter filter, EventHandler handler) {
    if (!handler) {
        throw std::invalid_argument("Event handler must not be empty");
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    SubscriptionHandle handle = next_handle_++;
    subscribers_.emplace(handle, Subscription{std::move(filter), std::move(handler)});
    return handle;
}

bool EventBus::unsubscribe(SubscriptionHandle handle) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return subscribers_.erase(handle) > 0;
}

void EventBus::publish(Event event) {
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mutex_);

    std::vector<std::pair<SubscriptionHandle, EventHandler>> targets;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        event.sequence = ++sequences_[event.job_id];
        if (event.timestamp == Timestamp{}) {
            event.timestamp = now();
        }

        if (history_limit_ > 0) {
            auto& job_history = history_[event.job_id];
            job_history.push_back(event);
            while (job_history.size() > history_limit_) {
                job_history.pop_front();
            }
        }

        for (const auto& [handle, subscription] : subscribers_) {
            if (subscription.filter.matches(event)) {
                targets.emplace_back(handle, subscription.handler);
            }
        }
    }

    log_debug("events", std::string(to_string(event.type)) + " job=" + event.job_id +
                            (event.step_id ? " step=" + *event.step_id : std::string{}) +
                            " seq=" + std::to_string(event.sequence));

    for (const auto& [handle, handler] : targets) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            log_warning("events", "Subscriber " + std::to_string(handle) + " threw on " +
                                      to_string(event.type) + ": " + e.what());
        } catch (...) {
            log_warning("events", "Subscriber " + std::to_string(handle) + " threw a non-standard exception on " +
                                      to_string(event.type));
        }
    }
}

std::vector<Event> EventBus::history(const JobId& job_id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = history_.find(job_id);
    if (it == history_.end()) {
        return {};
    }
    return std::vector<Event>(it->second.begin(), it->second.end());
}

void EventBus::clear_history(const JobId& job_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    history_.erase(job_id);
}

void EventBus::forget_job(const JobId& job_id) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    history_.erase(job_id);
    sequences_.erase(job_id);
}

size_t EventBus::tracked_job_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return sequences_.size();
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return subscribers_.size();
}

} // namespace ucop
