#include "ttl_cache.hpp"
#include "util.hpp"
#include <algorithm>
#include <vector>

namespace trelay {

TtlCache::TtlCache(uint64_t ttl_ms, size_t max_entries, Clock clock)
    : ttl_ms_(ttl_ms), max_entries_(max_entries), clock_(std::move(clock)) {
    if (!clock_) clock_ = epoch_millis;
}

bool TtlCache::expired(const TtlEntry& entry, uint64_t now) const {
    // Clock stepped backwards: keep the entry rather than underflow.
    if (now < entry.inserted_at) return false;
    return (now - entry.inserted_at) >= ttl_ms_;
}

std::optional<std::string> TtlCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;

    if (expired(it->second, clock_())) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

void TtlCache::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    uint64_t now = clock_();
    entries_[key] = TtlEntry{value, now};

    if (max_entries_ > 0 && entries_.size() > max_entries_) {
        evict(now, key);
    }
}

void TtlCache::evict(uint64_t now, const std::string& keep) {
    // Must be called with mutex_ already held.

    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (expired(it->second, now)) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (entries_.size() <= max_entries_) return;

    // Still over capacity: drop the oldest insertions, never `keep`.
    std::vector<std::pair<uint64_t, std::string>> by_age; // {inserted_at, key}
    by_age.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        if (key == keep) continue;
        by_age.emplace_back(entry.inserted_at, key);
    }
    std::sort(by_age.begin(), by_age.end());

    size_t to_remove = std::min(entries_.size() - max_entries_, by_age.size());
    for (size_t i = 0; i < to_remove; ++i) {
        entries_.erase(by_age[i].second);
    }
}

size_t TtlCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void TtlCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace trelay
