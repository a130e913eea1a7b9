#pragma once
#include "transcript_events.hpp"
#include "transcript_header.hpp"
#include "ttl_cache.hpp"
#include <string>
#include <functional>
#include <optional>
#include <cstdint>

namespace trelay {

class Logger;
class SessionStore;
class Broadcaster;

constexpr uint64_t kBridgeCacheTtlMs = 10 * 60 * 1000; // 10 minutes

struct BridgeOptions {
    uint64_t cache_ttl_ms = kBridgeCacheTtlMs;
    size_t header_read_bytes = kHeaderReadBytes;
    size_t cache_max_entries = 0; // per cache, 0 = unbounded
    Clock clock;                  // empty = wall clock
};

// Reads the session id from a transcript prefix (path, max bytes).
using HeaderReader = std::function<std::optional<std::string>(const std::string&, size_t)>;

enum class BridgeOutcome {
    Emitted,
    Ignored,
};

// Turns transcript file updates into "chat" broadcasts keyed by session key.
//
// Per update:
//   file -> session key cache hit: emit immediately.
//   otherwise file -> session id (cache, else header read; none: ignore),
//   then session id -> session key (cache, else store scan; none: warn and
//   ignore), populate caches, emit.
// Failures never populate a cache, so a later update retries from scratch.
//
// Not copyable: the subscription captures `this`.
class TranscriptBridge {
public:
    TranscriptBridge(TranscriptEvents& events,
                     SessionStore& store,
                     Broadcaster& sink,
                     Logger* log = nullptr,
                     BridgeOptions options = {},
                     HeaderReader reader = {});
    ~TranscriptBridge();

    TranscriptBridge(const TranscriptBridge&) = delete;
    TranscriptBridge& operator=(const TranscriptBridge&) = delete;

    // Subscribe to transcript updates. No-op if already attached.
    void attach();

    // Unsubscribe; caches are kept. A notification already being dispatched
    // may still call into this bridge, so stop whatever drives
    // TranscriptEvents::emit (e.g. TranscriptWatcher::stop()) before
    // destroying it.
    void detach();

    bool attached() const { return static_cast<bool>(unsubscribe_); }

    // One notification, without the exception boundary attach() installs.
    BridgeOutcome handle_update(const std::string& session_file);

    const TtlCache& session_key_by_file() const { return session_key_by_file_; }
    const TtlCache& session_id_by_file() const { return session_id_by_file_; }
    const TtlCache& session_key_by_id() const { return session_key_by_id_; }

private:
    void on_update(const TranscriptUpdate& update);
    void emit(const std::string& session_key, const std::string& session_id);

    TranscriptEvents& events_;
    SessionStore& store_;
    Broadcaster& sink_;
    Logger* log_;
    BridgeOptions options_;
    HeaderReader reader_;
    Unsubscribe unsubscribe_;

    TtlCache session_key_by_file_;
    TtlCache session_id_by_file_;
    TtlCache session_key_by_id_;
};

} // namespace trelay
