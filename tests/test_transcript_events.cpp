#include <catch2/catch.hpp>
#include "transcript_events.hpp"
#include <vector>

using namespace trelay;

// ── Basic emit / subscribe ──────────────────────────────────────

TEST_CASE("TranscriptEvents: listener receives update", "[transcript_events]") {
    TranscriptEvents events;
    std::string seen;

    events.on_update([&](const TranscriptUpdate& u) { seen = u.session_file; });
    events.emit(TranscriptUpdate{"/tmp/a.jsonl"});

    REQUIRE(seen == "/tmp/a.jsonl");
}

TEST_CASE("TranscriptEvents: listeners called in registration order", "[transcript_events]") {
    TranscriptEvents events;
    std::vector<int> order;

    events.on_update([&](const TranscriptUpdate&) { order.push_back(1); });
    events.on_update([&](const TranscriptUpdate&) { order.push_back(2); });
    events.emit(TranscriptUpdate{"f"});

    REQUIRE(order == std::vector<int>{1, 2});
}

TEST_CASE("TranscriptEvents: emit with no listeners is a no-op", "[transcript_events]") {
    TranscriptEvents events;
    events.emit(TranscriptUpdate{"f"}); // should not crash
    REQUIRE(events.listener_count() == 0);
}

// ── Unsubscribe ─────────────────────────────────────────────────

TEST_CASE("TranscriptEvents: unsubscribe removes listener", "[transcript_events]") {
    TranscriptEvents events;
    int count = 0;

    auto unsubscribe = events.on_update([&](const TranscriptUpdate&) { count++; });
    events.emit(TranscriptUpdate{"f"});
    REQUIRE(count == 1);

    unsubscribe();
    events.emit(TranscriptUpdate{"f"});
    REQUIRE(count == 1);
    REQUIRE(events.listener_count() == 0);
}

TEST_CASE("TranscriptEvents: unsubscribe twice is harmless", "[transcript_events]") {
    TranscriptEvents events;
    auto keep = events.on_update([](const TranscriptUpdate&) {});
    auto drop = events.on_update([](const TranscriptUpdate&) {});

    drop();
    drop();
    REQUIRE(events.listener_count() == 1);
}

TEST_CASE("TranscriptEvents: listener may unsubscribe itself during emit", "[transcript_events]") {
    TranscriptEvents events;
    int count = 0;
    Unsubscribe self;

    self = events.on_update([&](const TranscriptUpdate&) {
        count++;
        self();
    });

    events.emit(TranscriptUpdate{"f"});
    events.emit(TranscriptUpdate{"f"});
    REQUIRE(count == 1);
}

TEST_CASE("TranscriptEvents: listener added during emit sees next update only", "[transcript_events]") {
    TranscriptEvents events;
    int late = 0;
    bool added = false;

    events.on_update([&](const TranscriptUpdate&) {
        if (!added) {
            added = true;
            events.on_update([&](const TranscriptUpdate&) { late++; });
        }
    });

    events.emit(TranscriptUpdate{"f"});
    REQUIRE(late == 0);
    events.emit(TranscriptUpdate{"f"});
    REQUIRE(late == 1);
}

// ── Clear ───────────────────────────────────────────────────────

TEST_CASE("TranscriptEvents: clear removes all listeners", "[transcript_events]") {
    TranscriptEvents events;
    int count = 0;
    auto unsubscribe = events.on_update([&](const TranscriptUpdate&) { count++; });
    events.on_update([&](const TranscriptUpdate&) { count++; });

    events.clear();
    events.emit(TranscriptUpdate{"f"});
    REQUIRE(count == 0);

    unsubscribe(); // stale handle after clear
    REQUIRE(events.listener_count() == 0);
}
