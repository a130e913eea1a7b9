#include "config.hpp"
#include "log.hpp"
#include "broadcast.hpp"
#include "session_store.hpp"
#include "transcript_events.hpp"
#include "transcript_bridge.hpp"
#include "transcript_watcher.hpp"
#include "util.hpp"
#include <iostream>
#include <string>
#include <cstring>
#include <thread>
#include <atomic>
#include <csignal>
#include <chrono>
#include <memory>
#include <vector>
#include <cstdint>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: trelay [options]\n"
              << "\n"
              << "Relays session transcript updates as \"chat\" events (JSON lines on stdout).\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH        Config file (default: ~/.trelay/config.json)\n"
              << "  --watch DIR          Transcript directory to poll\n"
              << "  --store PATH         Session store file (repeatable, replaces config list)\n"
              << "  --poll-ms N          Poll interval in milliseconds\n"
              << "  --once               Poll once, relay, and exit\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Environment variables:\n"
              << "  TRELAY_TRANSCRIPTS_DIR  Transcript directory\n"
              << "  TRELAY_SESSION_STORE    Colon-separated session store files\n"
              << "  TRELAY_CACHE_TTL        Bridge cache TTL in seconds\n";
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    std::string watch_dir;
    std::vector<std::string> store_paths;
    uint32_t poll_ms = 0;
    bool once = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--watch") == 0 && i + 1 < argc) {
            watch_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--store") == 0 && i + 1 < argc) {
            store_paths.emplace_back(argv[++i]);
        } else if (std::strcmp(argv[i], "--poll-ms") == 0 && i + 1 < argc) {
            auto parsed = trelay::parse_uint32(argv[++i]);
            if (!parsed || *parsed == 0) {
                std::cerr << "Invalid --poll-ms: " << argv[i] << "\n";
                print_usage();
                return 1;
            }
            poll_ms = *parsed;
        } else if (std::strcmp(argv[i], "--once") == 0) {
            once = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty() ? trelay::Config::load()
                                      : trelay::Config::load_from(config_path);

    // Override config with CLI args
    if (!watch_dir.empty()) config.watcher.transcripts_dir = watch_dir;
    if (!store_paths.empty()) config.sessions.store_paths = store_paths;
    if (poll_ms > 0) config.watcher.poll_interval_ms = poll_ms;

    if (config.watcher.transcripts_dir.empty()) {
        std::cerr << "Error: no transcript directory configured.\n";
        return 1;
    }

    trelay::StreamLogger log("trelay");
    trelay::JsonSessionStore store(config.sessions.store_paths, &log);
    trelay::BroadcastHub hub(config.broadcast.max_buffered_bytes, &log);
    hub.add_client(std::make_shared<trelay::StreamClient>(std::cout));

    trelay::BridgeOptions options;
    options.cache_ttl_ms = static_cast<uint64_t>(config.bridge.cache_ttl_seconds) * 1000;
    options.header_read_bytes = config.bridge.header_read_bytes;
    options.cache_max_entries = config.bridge.cache_max_entries;

    trelay::TranscriptEvents events;
    trelay::TranscriptBridge bridge(events, store, hub, &log, options);
    bridge.attach();

    trelay::TranscriptWatcher watcher(config.watcher.transcripts_dir, events,
                                      config.watcher.poll_interval_ms,
                                      config.watcher.extension, &log);

    if (once) {
        size_t n = watcher.poll_once();
        log.info("relayed " + std::to_string(n) + " transcript update(s)");
        bridge.detach();
        return 0;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    log.info("Watching " + config.watcher.transcripts_dir + " every " +
             std::to_string(config.watcher.poll_interval_ms) + "ms");
    watcher.start();

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    log.info("Shutting down.");
    watcher.stop();
    bridge.detach();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 1;
}
