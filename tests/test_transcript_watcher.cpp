#include <catch2/catch.hpp>
#include "transcript_watcher.hpp"
#include "transcript_bridge.hpp"
#include "test_doubles.hpp"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>

using namespace trelay;

struct WatchFixture {
    TempDir dir{"watcher"};
    TranscriptEvents events;
    std::mutex mutex;
    std::vector<std::string> seen;
    Unsubscribe unsubscribe = events.on_update([this](const TranscriptUpdate& u) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(u.session_file);
    });

    size_t seen_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return seen.size();
    }
};

static void append(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::app);
    out << text;
}

// ── poll_once ───────────────────────────────────────────────────

TEST_CASE("TranscriptWatcher: new files are reported", "[watcher]") {
    WatchFixture f;
    auto a = f.dir.write("a.jsonl", "{}\n");
    auto b = f.dir.write("b.jsonl", "");
    TranscriptWatcher watcher(f.dir.path.string(), f.events);

    REQUIRE(watcher.poll_once() == 2);
    std::sort(f.seen.begin(), f.seen.end());
    REQUIRE(f.seen == std::vector<std::string>{a, b});
}

TEST_CASE("TranscriptWatcher: unchanged files are not re-reported", "[watcher]") {
    WatchFixture f;
    f.dir.write("a.jsonl", "{}\n");
    TranscriptWatcher watcher(f.dir.path.string(), f.events);

    REQUIRE(watcher.poll_once() == 1);
    REQUIRE(watcher.poll_once() == 0);
    REQUIRE(f.seen.size() == 1);
}

TEST_CASE("TranscriptWatcher: growth is reported", "[watcher]") {
    WatchFixture f;
    auto a = f.dir.write("a.jsonl", "{}\n");
    TranscriptWatcher watcher(f.dir.path.string(), f.events);
    watcher.poll_once();

    append(a, "{\"type\":\"message\"}\n");
    REQUIRE(watcher.poll_once() == 1);
    REQUIRE(f.seen.back() == a);
}

TEST_CASE("TranscriptWatcher: other extensions and directories ignored", "[watcher]") {
    WatchFixture f;
    f.dir.write("notes.txt", "x");
    std::filesystem::create_directories(f.dir.path / "sub.jsonl");
    TranscriptWatcher watcher(f.dir.path.string(), f.events);

    REQUIRE(watcher.poll_once() == 0);
}

TEST_CASE("TranscriptWatcher: empty extension accepts any file", "[watcher]") {
    WatchFixture f;
    f.dir.write("session.log", "x");
    TranscriptWatcher watcher(f.dir.path.string(), f.events, 500, "");

    REQUIRE(watcher.poll_once() == 1);
}

TEST_CASE("TranscriptWatcher: removed then recreated file reads as new", "[watcher]") {
    WatchFixture f;
    auto a = f.dir.write("a.jsonl", "{}\n");
    TranscriptWatcher watcher(f.dir.path.string(), f.events);
    watcher.poll_once();

    std::filesystem::remove(a);
    REQUIRE(watcher.poll_once() == 0);

    f.dir.write("a.jsonl", "{}\n");
    REQUIRE(watcher.poll_once() == 1);
}

TEST_CASE("TranscriptWatcher: missing directory yields nothing", "[watcher]") {
    WatchFixture f;
    TranscriptWatcher watcher(f.dir.file("does-not-exist"), f.events);
    REQUIRE(watcher.poll_once() == 0);
}

// ── Background thread ───────────────────────────────────────────

TEST_CASE("TranscriptWatcher: start polls until stop", "[watcher]") {
    WatchFixture f;
    f.dir.write("a.jsonl", "{}\n");
    TranscriptWatcher watcher(f.dir.path.string(), f.events, 10);

    watcher.start();
    REQUIRE(watcher.running());
    for (int i = 0; i < 200 && f.seen_count() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    watcher.stop();

    REQUIRE_FALSE(watcher.running());
    REQUIRE(f.seen_count() == 1);
    watcher.stop(); // second stop is harmless
}

// ── Watcher feeding the bridge ──────────────────────────────────

TEST_CASE("TranscriptWatcher: drives bridge end to end", "[watcher]") {
    TempDir dir("watcher_bridge");
    dir.write("a.jsonl", "{\"type\":\"session\",\"id\":\"sess-42\"}\n");

    TranscriptEvents events;
    MockSessionStore store;
    store.snapshot["key-alpha"] = SessionEntry{"sess-42", 0};
    RecordingBroadcaster sink;
    TranscriptBridge bridge(events, store, sink);
    bridge.attach();
    TranscriptWatcher watcher(dir.path.string(), events);

    watcher.poll_once();
    REQUIRE(sink.calls.size() == 1);
    REQUIRE(sink.calls[0].payload["sessionKey"] == "key-alpha");

    append(dir.file("a.jsonl"), "{\"type\":\"message\"}\n");
    watcher.poll_once();
    REQUIRE(sink.calls.size() == 2);
    REQUIRE(store.load_count == 1);
}
