#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>

namespace trelay {

// Leaves out untouched unless obj[key] is an unsigned integer that fits.
static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number_unsigned()) return;
    auto value = it->get<uint64_t>();
    if (value <= std::numeric_limits<uint32_t>::max())
        out = static_cast<uint32_t>(value);
}

nlohmann::json Config::defaults_json() {
    return {
        {"bridge", {
            {"cache_ttl_seconds", 600},
            {"header_read_bytes", 8192},
            {"cache_max_entries", 0}
        }},
        {"sessions", {
            {"store_paths", nlohmann::json::array({"~/.trelay/sessions.json"})}
        }},
        {"watcher", {
            {"transcripts_dir", "~/.trelay/transcripts"},
            {"poll_interval_ms", 500},
            {"extension", ".jsonl"}
        }},
        {"broadcast", {
            {"max_buffered_bytes", 1048576}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("bridge") && j["bridge"].is_object()) {
        auto& b = j["bridge"];
        read_u32(b, "cache_ttl_seconds", cfg.bridge.cache_ttl_seconds);
        read_u32(b, "header_read_bytes", cfg.bridge.header_read_bytes);
        read_u32(b, "cache_max_entries", cfg.bridge.cache_max_entries);
    }

    if (j.contains("sessions") && j["sessions"].is_object()) {
        auto& s = j["sessions"];
        if (s.contains("store_paths") && s["store_paths"].is_array()) {
            for (const auto& p : s["store_paths"]) {
                if (p.is_string())
                    cfg.sessions.store_paths.push_back(expand_home(p.get<std::string>()));
            }
        }
    }

    if (j.contains("watcher") && j["watcher"].is_object()) {
        auto& w = j["watcher"];
        if (w.contains("transcripts_dir") && w["transcripts_dir"].is_string())
            cfg.watcher.transcripts_dir = expand_home(w["transcripts_dir"].get<std::string>());
        read_u32(w, "poll_interval_ms", cfg.watcher.poll_interval_ms);
        if (w.contains("extension") && w["extension"].is_string())
            cfg.watcher.extension = w["extension"].get<std::string>();
    }

    if (j.contains("broadcast") && j["broadcast"].is_object()) {
        auto& b = j["broadcast"];
        read_u32(b, "max_buffered_bytes", cfg.broadcast.max_buffered_bytes);
    }

    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("TRELAY_TRANSCRIPTS_DIR"))
        watcher.transcripts_dir = expand_home(v);
    if (const char* v = std::getenv("TRELAY_SESSION_STORE")) {
        sessions.store_paths.clear();
        for (const auto& p : split(v, ':')) {
            std::string path = trim(p);
            if (!path.empty()) sessions.store_paths.push_back(expand_home(path));
        }
    }
    if (const char* v = std::getenv("TRELAY_CACHE_TTL")) {
        if (auto ttl = parse_uint32(v))
            bridge.cache_ttl_seconds = *ttl;
        else
            std::cerr << "[config] Ignoring invalid TRELAY_CACHE_TTL: " << v << "\n";
    }
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json on_disk = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(on_disk, defaults_json());
            if (j != on_disk) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
                else
                    std::cerr << "[config] Warning: failed to write migrated config "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception&) {
            // Config file is malformed; fall back to defaults
            std::cerr << "[config] Malformed config, using defaults: " << config_path << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
        else
            std::cerr << "[config] Warning: failed to create default config "
                      << config_path << "\n";
    }

    Config cfg = from_json(j);
    cfg.apply_env();
    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.trelay/config.json"));
}

} // namespace trelay
