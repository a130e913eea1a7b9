#pragma once
#include <string>
#include <vector>
#include <functional>
#include <mutex>
#include <cstdint>

namespace trelay {

// "A transcript file has new content." Delivery is at-least-once: the same
// file may be reported several times for one logical write.
struct TranscriptUpdate {
    std::string session_file;
};

using TranscriptListener = std::function<void(const TranscriptUpdate&)>;
using Unsubscribe = std::function<void()>;

class TranscriptEvents {
public:
    // Register a listener. The returned function removes it; calling it
    // again (or after clear()) does nothing.
    Unsubscribe on_update(TranscriptListener listener);

    // Notify synchronously, in registration order. The mutex is released
    // before listeners run, so they may subscribe or unsubscribe.
    void emit(const TranscriptUpdate& update);

    size_t listener_count() const;
    void clear();

private:
    bool remove(uint64_t id);

    struct Subscription {
        uint64_t id;
        TranscriptListener listener;
    };

    mutable std::mutex mutex_;
    std::vector<Subscription> listeners_;
    uint64_t next_id_ = 1;
};

} // namespace trelay
