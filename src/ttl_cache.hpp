#pragma once
#include <string>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <cstdint>
#include <optional>

namespace trelay {

// Millisecond clock; injectable so tests can move time.
using Clock = std::function<uint64_t()>;

struct TtlEntry {
    std::string value;
    uint64_t inserted_at; // ms
};

// String-to-string map whose entries expire ttl_ms after insertion.
// Expired entries are erased lazily by the lookup that finds them; there
// is no background sweep. With max_entries == 0 the map is unbounded, so
// keys that are never looked up again stay resident.
class TtlCache {
public:
    explicit TtlCache(uint64_t ttl_ms, size_t max_entries = 0, Clock clock = {});

    // Value if present and younger than the TTL. An expired entry is
    // erased before returning nullopt.
    std::optional<std::string> get(const std::string& key);

    // Insert or overwrite, stamped with the current time.
    void set(const std::string& key, const std::string& value);

    size_t size() const;
    void clear();

    uint64_t ttl_ms() const { return ttl_ms_; }

private:
    bool expired(const TtlEntry& entry, uint64_t now) const;
    void evict(uint64_t now, const std::string& keep);

    uint64_t ttl_ms_;
    size_t max_entries_;
    Clock clock_;
    std::unordered_map<std::string, TtlEntry> entries_;
    mutable std::mutex mutex_;
};

} // namespace trelay
