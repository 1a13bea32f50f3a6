// tests/test_event_bus.cpp
#include <catch2/catch_test_macros.hpp>
#include "modules/events/event_bus.h"
#include <stdexcept>
#include <thread>
#include <vector>

using namespace ucop;

namespace {

Event event_for(const JobId& job_id, EventType type, nlohmann::json payload = nlohmann::json::object()) {
    Event event;
    event.type = type;
    event.job_id = job_id;
    event.payload = std::move(payload);
    return event;
}

} // namespace

TEST_CASE("Subscribers receive matching events in emission order", "[events]") {
    EventBus bus;
    std::vector<Event> job_a;
    std::vector<EventType> failures_only;

    bus.subscribe(EventFilter{"job_a", {}}, [&](const Event& e) { job_a.push_back(e); });
    bus.subscribe(EventFilter{std::nullopt, {EventType::JOB_FAILED}}, [&](const Event& e) { failures_only.push_back(e.type); });

    bus.publish(event_for("job_a", EventType::JOB_STARTED));
    bus.publish(event_for("job_b", EventType::JOB_FAILED));
    bus.publish(event_for("job_a", EventType::LEVEL_COMPLETED, {{"level", 0}}));
    bus.publish(event_for("job_a", EventType::JOB_FAILED));

    REQUIRE(job_a.size() == 3);
    REQUIRE(job_a[0].type == EventType::JOB_STARTED);
    REQUIRE(job_a[1].payload["level"] == 0);
    REQUIRE(job_a[2].type == EventType::JOB_FAILED);
    REQUIRE(job_a[0].sequence == 1);
    REQUIRE(job_a[1].sequence == 2);
    REQUIRE(job_a[2].sequence == 3);
    REQUIRE(job_a[0].timestamp != Timestamp{});

    REQUIRE(failures_only == std::vector<EventType>{EventType::JOB_FAILED, EventType::JOB_FAILED});
}

TEST_CASE("Late subscribers only see later events", "[events]") {
    EventBus bus;
    bus.publish(event_for("job", EventType::JOB_CREATED));
    bus.publish(event_for("job", EventType::JOB_STARTED));

    std::vector<EventType> seen;
    auto handle = bus.subscribe(EventFilter{"job", {}}, [&](const Event& e) { seen.push_back(e.type); });
    bus.publish(event_for("job", EventType::JOB_COMPLETED));

    REQUIRE(seen == std::vector<EventType>{EventType::JOB_COMPLETED});

    REQUIRE(bus.unsubscribe(handle));
    REQUIRE_FALSE(bus.unsubscribe(handle));
    bus.publish(event_for("job", EventType::JOB_RECOVERED));
    REQUIRE(seen.size() == 1);

    // history still replays everything retained
    auto history = bus.history("job");
    REQUIRE(history.size() == 4);
    REQUIRE(history.front().type == EventType::JOB_CREATED);
    REQUIRE(history.back().sequence == 4);
}

TEST_CASE("A throwing handler does not disturb others", "[events][errors]") {
    EventBus bus;
    int delivered = 0;
    bus.subscribe(EventFilter{}, [](const Event&) { throw std::runtime_error("subscriber bug"); });
    bus.subscribe(EventFilter{}, [](const Event&) { throw 7; });
    bus.subscribe(EventFilter{}, [&](const Event&) { ++delivered; });

    REQUIRE_NOTHROW(bus.publish(event_for("job", EventType::STEP_COMPLETED)));
    REQUIRE(delivered == 1);
    REQUIRE(bus.subscriber_count() == 3);
    REQUIRE_THROWS_AS(bus.subscribe(EventFilter{}, EventHandler{}), std::invalid_argument);
}

TEST_CASE("Handlers may publish follow-up events", "[events]") {
    EventBus bus;
    std::vector<EventType> seen;
    bus.subscribe(EventFilter{"job", {EventType::CHECKPOINT_FAILED}}, [&](const Event& e) {
        bus.publish(event_for(e.job_id, EventType::JOB_FAILED));
    });
    bus.subscribe(EventFilter{"job", {}}, [&](const Event& e) { seen.push_back(e.type); });

    bus.publish(event_for("job", EventType::CHECKPOINT_FAILED));
    REQUIRE(seen.size() == 2);
}

TEST_CASE("History is bounded per job", "[events][history]") {
    EventBus bus(3);
    for (int i = 0; i < 5; ++i) {
        bus.publish(event_for("job", EventType::LEVEL_COMPLETED, {{"level", i}}));
    }
    auto history = bus.history("job");
    REQUIRE(history.size() == 3);
    REQUIRE(history.front().payload["level"] == 2);
    REQUIRE(history.back().sequence == 5);

    bus.clear_history("job");
    REQUIRE(bus.history("job").empty());

    EventBus silent(0);
    silent.publish(event_for("job", EventType::JOB_CREATED));
    REQUIRE(silent.history("job").empty());
}

TEST_CASE("Per-job order holds across publishing threads", "[events][concurrency]") {
    EventBus bus(0);
    std::vector<uint64_t> sequences;
    bus.subscribe(EventFilter{"shared", {}}, [&](const Event& e) { sequences.push_back(e.sequence); });

    std::vector<std::thread> publishers;
    for (int t = 0; t < 4; ++t) {
        publishers.emplace_back([&bus] {
            for (int i = 0; i < 50; ++i) {
                bus.publish(event_for("shared", EventType::STEP_COMPLETED));
            }
        });
    }
    for (auto& t : publishers) t.join();

    REQUIRE(sequences.size() == 200);
    for (size_t i = 0; i < sequences.size(); ++i) {
        REQUIRE(sequences[i] == i + 1);
    }
}
