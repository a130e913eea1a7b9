#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace trelay {

class Logger;

struct SessionEntry {
    std::string session_id;
    uint64_t updated_at = 0; // epoch ms, 0 if unknown
};

// Session key -> entry. Ordered so that iteration (and therefore the
// resolver's first match) is by ascending session key.
using SessionStoreSnapshot = std::map<std::string, SessionEntry>;

// Read-only view of the host's session registry.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    // Fresh snapshot on every call; callers cache results, not snapshots.
    virtual SessionStoreSnapshot load() = 0;
};

// Combines one or more sessions.json files:
//   { "<session key>": { "sessionId": "...", "updatedAt": 1700000000000, ... } }
// Missing files contribute nothing; malformed files contribute nothing and
// are reported through the logger. A key present in several files keeps
// the record with the larger updatedAt (ties keep the earlier file).
class JsonSessionStore : public SessionStore {
public:
    explicit JsonSessionStore(std::vector<std::string> paths, Logger* log = nullptr);

    SessionStoreSnapshot load() override;

    const std::vector<std::string>& paths() const { return paths_; }

private:
    std::vector<std::string> paths_;
    Logger* log_;
};

// Key whose trimmed sessionId equals the trimmed session_id, scanning the
// whole snapshot in key order. Empty keys never match. Session ids are
// expected to be unique across keys; if they are not, the smallest key wins.
std::optional<std::string> resolve_session_key(const SessionStoreSnapshot& snapshot,
                                               const std::string& session_id);

} // namespace trelay
