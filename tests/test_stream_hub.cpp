#include <catch2/catch_test_macros.hpp>
#include "stream_hub.hpp"
#include <thread>

using namespace tailf;

namespace {

LineEvent make_line(const std::string& source, std::uint64_t seq) {
    LineEvent event;
    event.source_id = source;
    event.seq = seq;
    event.timestamp = now_seconds();
    event.content = "line " + std::to_string(seq);
    return event;
}

} // namespace

TEST_CASE("StreamHub fan-out", "[hub]") {
    StreamHub hub;

    auto a = hub.subscribe("app");
    auto b = hub.subscribe("app");
    auto other = hub.subscribe("db");

    for (std::uint64_t seq = 1; seq <= 3; ++seq) {
        hub.publish(make_line("app", seq));
    }

    SECTION("Every subscriber of the source gets every line in order") {
        for (const auto& sub : {a, b}) {
            auto events = sub->drain();
            REQUIRE(events.size() == 3);
            for (std::size_t i = 0; i < events.size(); ++i) {
                REQUIRE(events[i].is_line());
                REQUIRE(events[i].line.seq == i + 1);
            }
        }
        REQUIRE(other->drain().empty());
    }

    SECTION("Errors reach subscribers of that source only") {
        a->drain();
        ErrorEvent error;
        error.source_id = "app";
        error.kind = ErrorKind::SourceUnavailable;
        error.message = "gone";
        hub.publish_error(error);

        auto event = a->next(std::chrono::milliseconds(100));
        REQUIRE(event.has_value());
        REQUIRE(event->type == StreamEvent::Type::Error);
        REQUIRE(std::string(event->event_name()) == "error");
        REQUIRE(event->to_json()["errorKind"] == "SourceUnavailable");
        REQUIRE(other->drain().empty());
    }

    SECTION("Unsubscribe closes the queue") {
        REQUIRE(hub.subscriber_count("app") == 2);
        REQUIRE(hub.unsubscribe(a->id()));
        REQUIRE_FALSE(hub.unsubscribe(a->id()));
        REQUIRE(hub.subscriber_count("app") == 1);
        REQUIRE(a->closed());

        hub.publish(make_line("app", 4));
        REQUIRE(a->drain().size() == 3);
        REQUIRE(b->drain().size() == 4);
    }

    SECTION("Stats") {
        auto stats = hub.stats();
        REQUIRE(stats.subscribers == 3);
        REQUIRE(stats.published == 3);
        REQUIRE(stats.dropped == 0);
    }
}

TEST_CASE("StreamHub slow subscriber drops oldest behind a gap marker", "[hub]") {
    HubSettings settings;
    settings.backlog_lines = 0;
    StreamHub hub(settings);

    auto slow = hub.subscribe("app", 4);
    auto fast = hub.subscribe("app", 64);

    for (std::uint64_t seq = 1; seq <= 10; ++seq) {
        hub.publish(make_line("app", seq));
    }

    auto events = slow->drain();
    REQUIRE(events.size() == 4);

    REQUIRE(events[0].is_gap());
    REQUIRE(events[0].line.gap == 7);
    REQUIRE(events[0].line.seq == 7);
    REQUIRE(events[0].to_json()["gap"] == 7);

    REQUIRE(events[1].line.seq == 8);
    REQUIRE(events[2].line.seq == 9);
    REQUIRE(events[3].line.seq == 10);
    REQUIRE(slow->dropped_count() == 7);

    // Lines delivered plus lines reported lost account for everything
    std::uint64_t delivered = 0;
    for (const auto& e : events) {
        if (!e.is_gap()) ++delivered;
    }
    REQUIRE(delivered + events[0].line.gap == 10);

    // The slow reader never held up the other one
    auto all = fast->drain();
    REQUIRE(all.size() == 10);
    REQUIRE(fast->dropped_count() == 0);
    REQUIRE(hub.stats().dropped == 7);
}

TEST_CASE("StreamHub overflow keeps the gap count and rotation markers", "[hub]") {
    HubSettings settings;
    settings.backlog_lines = 0;
    StreamHub hub(settings);
    auto slow = hub.subscribe("app", 3);

    for (std::uint64_t seq = 1; seq <= 4; ++seq) {
        hub.publish(make_line("app", seq));
    }

    LineEvent rotated = make_line("app", 4);
    rotated.content = "file rotated";
    rotated.rotated = true;
    hub.publish(rotated);

    ErrorEvent error;
    error.source_id = "app";
    error.message = "stream closed";
    hub.publish_error(error);

    SECTION("Lines 1..4 are gone; the marker and the error are still queued") {
        auto events = slow->drain();
        REQUIRE(events.size() == 3);
        REQUIRE(events[0].is_gap());
        REQUIRE(events[0].line.gap == 4);
        REQUIRE(events[1].line.rotated);
        REQUIRE(events[2].type == StreamEvent::Type::Error);
        REQUIRE(slow->dropped_count() == 4);
    }

    SECTION("Nothing but markers and errors behind the gap: the gap stays at the head") {
        hub.publish_error(error);

        auto events = slow->drain();
        REQUIRE(events.size() == 3);
        REQUIRE(events[0].is_gap());
        REQUIRE(events[0].line.gap == 4);
        REQUIRE(events[1].type == StreamEvent::Type::Error);
        REQUIRE(events[2].type == StreamEvent::Type::Error);
        REQUIRE(slow->dropped_count() == 4);
    }
}

TEST_CASE("StreamHub backlog", "[hub]") {
    HubSettings settings;
    settings.backlog_lines = 3;
    StreamHub hub(settings);

    for (std::uint64_t seq = 1; seq <= 5; ++seq) {
        hub.publish(make_line("app", seq));
    }

    SECTION("New subscriber starts with the recent lines") {
        auto sub = hub.subscribe("app");
        auto events = sub->drain();
        REQUIRE(events.size() == 3);
        REQUIRE(events[0].line.seq == 3);
        REQUIRE(events[2].line.seq == 5);

        hub.publish(make_line("app", 6));
        auto next = sub->next(std::chrono::milliseconds(100));
        REQUIRE(next.has_value());
        REQUIRE(next->line.seq == 6);
    }

    SECTION("Cleared backlog is not replayed") {
        hub.clear_backlog("app");
        REQUIRE(hub.backlog("app").empty());
        auto sub = hub.subscribe("app");
        REQUIRE(sub->drain().empty());
    }
}

TEST_CASE("StreamHub forget_source", "[hub]") {
    StreamHub hub;
    auto sub = hub.subscribe("scanned/a.log");
    hub.publish(make_line("scanned/a.log", 1));

    hub.forget_source("scanned/a.log");

    REQUIRE(sub->closed());
    REQUIRE(hub.subscriber_count("scanned/a.log") == 0);
    REQUIRE(hub.backlog("scanned/a.log").empty());

    // Queued events stay readable after close, then next() gives up at once
    REQUIRE(sub->next(std::chrono::milliseconds(10)).has_value());
    REQUIRE_FALSE(sub->next(std::chrono::milliseconds(1000)).has_value());
}

TEST_CASE("Subscriber next wakes on publish", "[hub]") {
    StreamHub hub;
    auto sub = hub.subscribe("app");

    std::thread producer([&hub]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        hub.publish(make_line("app", 1));
    });

    auto event = sub->next(std::chrono::milliseconds(2000));
    producer.join();

    REQUIRE(event.has_value());
    REQUIRE(event->line.seq == 1);
}
