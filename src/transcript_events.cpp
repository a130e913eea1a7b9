#include "transcript_events.hpp"

namespace trelay {

Unsubscribe TranscriptEvents::on_update(TranscriptListener listener) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_id_++;
        listeners_.push_back(Subscription{id, std::move(listener)});
    }
    return [this, id]() { remove(id); };
}

bool TranscriptEvents::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
        if (it->id == id) {
            listeners_.erase(it);
            return true;
        }
    }
    return false;
}

void TranscriptEvents::emit(const TranscriptUpdate& update) {
    // Copy listeners out under lock, then call without lock held.
    std::vector<TranscriptListener> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_call.reserve(listeners_.size());
        for (const auto& sub : listeners_) {
            to_call.push_back(sub.listener);
        }
    }
    for (const auto& listener : to_call) {
        listener(update);
    }
}

size_t TranscriptEvents::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void TranscriptEvents::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.clear();
}

} // namespace trelay
