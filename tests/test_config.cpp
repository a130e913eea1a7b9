#include <catch2/catch.hpp>
#include "config.hpp"
#include "test_doubles.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <optional>
#include <nlohmann/json.hpp>

using namespace trelay;

// Unsets TRELAY_* for the duration of a test, restoring previous values.
struct EnvGuard {
    std::vector<std::pair<std::string, std::optional<std::string>>> saved;

    EnvGuard() {
        for (const char* name : {"TRELAY_TRANSCRIPTS_DIR", "TRELAY_SESSION_STORE", "TRELAY_CACHE_TTL"}) {
            const char* v = std::getenv(name);
            saved.emplace_back(name, v ? std::optional<std::string>(v) : std::nullopt);
            unsetenv(name);
        }
    }

    ~EnvGuard() {
        for (const auto& [name, value] : saved) {
            if (value) setenv(name.c_str(), value->c_str(), 1);
            else unsetenv(name.c_str());
        }
    }
};

static nlohmann::json read_json(const std::string& path) {
    std::ifstream in(path);
    return nlohmann::json::parse(in);
}

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);
    REQUIRE(cfg.bridge.header_read_bytes == 8192);
    REQUIRE(cfg.bridge.cache_max_entries == 0);
    REQUIRE(cfg.watcher.poll_interval_ms == 500);
    REQUIRE(cfg.watcher.extension == ".jsonl");
    REQUIRE(cfg.broadcast.max_buffered_bytes == 1048576);
}

TEST_CASE("Config::from_json: defaults_json round-trips to defaults", "[config]") {
    Config cfg = Config::from_json(Config::defaults_json());
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);
    REQUIRE(cfg.sessions.store_paths.size() == 1);
    REQUIRE(cfg.sessions.store_paths[0].find('~') == std::string::npos);
    REQUIRE(cfg.watcher.transcripts_dir.find("transcripts") != std::string::npos);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    nlohmann::json j = {
        {"bridge", {{"cache_ttl_seconds", "ten"}, {"header_read_bytes", -1}}},
        {"watcher", {{"poll_interval_ms", 2.5}, {"extension", 3}}},
        {"sessions", {{"store_paths", {"/a.json", 7, "/b.json"}}}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);
    REQUIRE(cfg.bridge.header_read_bytes == 8192);
    REQUIRE(cfg.watcher.poll_interval_ms == 500);
    REQUIRE(cfg.watcher.extension == ".jsonl");
    REQUIRE(cfg.sessions.store_paths == std::vector<std::string>{"/a.json", "/b.json"});
}

// ── load_from ────────────────────────────────────────────────────

TEST_CASE("Config::load_from: creates default file when missing", "[config]") {
    EnvGuard env;
    TempDir dir("config_create");
    auto path = dir.file("config.json");

    Config cfg = Config::load_from(path);
    REQUIRE(std::filesystem::exists(path));
    REQUIRE(read_json(path) == Config::defaults_json());
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);
}

TEST_CASE("Config::load_from: file values and merged defaults", "[config]") {
    EnvGuard env;
    TempDir dir("config_merge");
    auto path = dir.write("config.json", R"({
        "bridge": {"cache_ttl_seconds": 30},
        "watcher": {"transcripts_dir": "/var/transcripts"}
    })");

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.bridge.cache_ttl_seconds == 30);
    REQUIRE(cfg.bridge.header_read_bytes == 8192);
    REQUIRE(cfg.watcher.transcripts_dir == "/var/transcripts");

    // Missing keys were written back
    auto written = read_json(path);
    REQUIRE(written["bridge"]["cache_ttl_seconds"] == 30);
    REQUIRE(written["bridge"].contains("header_read_bytes"));
    REQUIRE(written.contains("broadcast"));
}

TEST_CASE("Config::load_from: malformed file falls back to defaults", "[config]") {
    EnvGuard env;
    TempDir dir("config_bad");
    auto path = dir.write("config.json", "{ nope");

    Config cfg = Config::load_from(path);
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);
    REQUIRE(cfg.sessions.store_paths.size() == 1);
}

// ── Environment overrides ────────────────────────────────────────

TEST_CASE("Config::apply_env: overrides file values", "[config]") {
    EnvGuard env;
    setenv("TRELAY_TRANSCRIPTS_DIR", "/env/transcripts", 1);
    setenv("TRELAY_SESSION_STORE", "/one.json: /two.json:", 1);
    setenv("TRELAY_CACHE_TTL", "45", 1);

    Config cfg = Config::from_json(Config::defaults_json());
    cfg.apply_env();

    REQUIRE(cfg.watcher.transcripts_dir == "/env/transcripts");
    REQUIRE(cfg.sessions.store_paths == std::vector<std::string>{"/one.json", "/two.json"});
    REQUIRE(cfg.bridge.cache_ttl_seconds == 45);
}

TEST_CASE("Config::apply_env: invalid TTL is ignored", "[config]") {
    EnvGuard env;
    setenv("TRELAY_CACHE_TTL", "soon", 1);

    Config cfg;
    cfg.apply_env();
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);
}

TEST_CASE("Config::apply_env: negative or oversized TTL is ignored", "[config]") {
    EnvGuard env;
    Config cfg;

    setenv("TRELAY_CACHE_TTL", "-1", 1);
    cfg.apply_env();
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);

    setenv("TRELAY_CACHE_TTL", "4294967296", 1);
    cfg.apply_env();
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);
}

TEST_CASE("Config::from_json: values beyond 32 bits keep defaults", "[config]") {
    nlohmann::json j = {
        {"bridge", {{"cache_ttl_seconds", 4294967296ULL}, {"header_read_bytes", 4096}}},
        {"broadcast", {{"max_buffered_bytes", 18446744073709551615ULL}}}
    };
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.bridge.cache_ttl_seconds == 600);
    REQUIRE(cfg.bridge.header_read_bytes == 4096);
    REQUIRE(cfg.broadcast.max_buffered_bytes == 1048576);
}
