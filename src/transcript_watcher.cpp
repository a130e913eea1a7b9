#include "transcript_watcher.hpp"
#include "log.hpp"
#include <chrono>
#include <vector>

namespace fs = std::filesystem;

namespace trelay {

TranscriptWatcher::TranscriptWatcher(std::string dir,
                                     TranscriptEvents& events,
                                     uint32_t poll_interval_ms,
                                     std::string extension,
                                     Logger* log)
    : dir_(std::move(dir)),
      events_(events),
      poll_interval_ms_(poll_interval_ms),
      extension_(std::move(extension)),
      log_(log)
{}

TranscriptWatcher::~TranscriptWatcher() {
    stop();
}

size_t TranscriptWatcher::poll_once() {
    std::vector<std::string> changed;
    {
        std::lock_guard<std::mutex> lock(scan_mutex_);

        std::error_code ec;
        fs::directory_iterator it(dir_, ec);
        if (ec) return 0;

        std::unordered_map<std::string, FileState> seen;
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) break;
            const auto& entry = *it;

            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec) || entry_ec) continue;
            if (!extension_.empty() && entry.path().extension().string() != extension_) continue;

            FileState state;
            state.size = entry.file_size(entry_ec);
            if (entry_ec) continue; // removed between listing and stat
            state.mtime = entry.last_write_time(entry_ec);
            if (entry_ec) continue;

            std::string path = entry.path().string();
            auto prev = known_.find(path);
            if (prev == known_.end() ||
                prev->second.size != state.size ||
                prev->second.mtime != state.mtime) {
                changed.push_back(path);
            }
            seen.emplace(std::move(path), state);
        }
        if (ec && log_) log_->warn("transcript scan of " + dir_ + " cut short: " + ec.message());

        // Files that disappeared are forgotten; a recreated file reads as new.
        known_ = std::move(seen);
    }

    for (const auto& path : changed) {
        events_.emit(TranscriptUpdate{path});
    }
    return changed.size();
}

void TranscriptWatcher::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&TranscriptWatcher::poll_loop, this);
}

void TranscriptWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false) && !thread_.joinable()) return;
    }
    wake_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void TranscriptWatcher::poll_loop() {
    while (running_.load()) {
        poll_once();

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_),
                       [this] { return !running_.load(); });
    }
}

} // namespace trelay
