#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace trelay {

struct BridgeConfig {
    uint32_t cache_ttl_seconds = 600;
    uint32_t header_read_bytes = 8192;
    uint32_t cache_max_entries = 0; // 0 = unbounded
};

struct SessionsConfig {
    std::vector<std::string> store_paths;
};

struct WatcherConfig {
    std::string transcripts_dir;
    uint32_t poll_interval_ms = 500;
    std::string extension = ".jsonl";
};

struct BroadcastConfig {
    uint32_t max_buffered_bytes = 1048576;
};

struct Config {
    BridgeConfig bridge;
    SessionsConfig sessions;
    WatcherConfig watcher;
    BroadcastConfig broadcast;

    // Load from ~/.trelay/config.json + env vars
    static Config load();

    // Load from an explicit path. A missing file is created with defaults;
    // missing keys are merged in and written back.
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a (merged) config object. Wrong-typed values keep defaults.
    static Config from_json(const nlohmann::json& j);

    // Apply TRELAY_* environment overrides
    void apply_env();
};

} // namespace trelay
