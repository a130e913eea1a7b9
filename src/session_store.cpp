#include "session_store.hpp"
#include "log.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace trelay {

JsonSessionStore::JsonSessionStore(std::vector<std::string> paths, Logger* log)
    : paths_(std::move(paths)), log_(log)
{}

SessionStoreSnapshot JsonSessionStore::load() {
    SessionStoreSnapshot combined;

    for (const auto& path : paths_) {
        std::ifstream file(path);
        if (!file.is_open()) continue;

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            if (log_) log_->warn("failed to parse session store " + path + ": " + e.what());
            continue;
        }
        if (!j.is_object()) {
            if (log_) log_->warn("session store is not an object: " + path);
            continue;
        }

        for (auto& [key, record] : j.items()) {
            if (!record.is_object()) continue;
            if (!record.contains("sessionId") || !record["sessionId"].is_string()) continue;

            SessionEntry entry;
            entry.session_id = record["sessionId"].get<std::string>();
            if (record.contains("updatedAt") && record["updatedAt"].is_number_unsigned())
                entry.updated_at = record["updatedAt"].get<uint64_t>();

            auto it = combined.find(key);
            if (it == combined.end()) {
                combined.emplace(key, std::move(entry));
            } else if (entry.updated_at > it->second.updated_at) {
                it->second = std::move(entry);
            }
        }
    }

    return combined;
}

std::optional<std::string> resolve_session_key(const SessionStoreSnapshot& snapshot,
                                               const std::string& session_id) {
    std::string wanted = trim(session_id);
    if (wanted.empty()) return std::nullopt;

    for (const auto& [key, entry] : snapshot) {
        if (key.empty()) continue;
        std::string candidate = trim(entry.session_id);
        if (!candidate.empty() && candidate == wanted) {
            return key;
        }
    }
    return std::nullopt;
}

} // namespace trelay
