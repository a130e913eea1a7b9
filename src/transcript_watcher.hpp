#pragma once
#include "transcript_events.hpp"
#include <string>
#include <unordered_map>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <mutex>
#include <thread>
#include <cstdint>

namespace trelay {

class Logger;

// Polls one directory (non-recursive) for transcript files and emits a
// TranscriptUpdate for each file that appeared, grew, shrank or was
// touched since the previous scan.
class TranscriptWatcher {
public:
    TranscriptWatcher(std::string dir,
                      TranscriptEvents& events,
                      uint32_t poll_interval_ms = 500,
                      std::string extension = ".jsonl",
                      Logger* log = nullptr);
    ~TranscriptWatcher();

    TranscriptWatcher(const TranscriptWatcher&) = delete;
    TranscriptWatcher& operator=(const TranscriptWatcher&) = delete;

    // Scan once and emit updates. Returns the number emitted. A missing
    // directory yields 0.
    size_t poll_once();

    // Poll on a background thread until stop().
    void start();
    void stop();
    bool running() const { return running_.load(); }

private:
    struct FileState {
        uintmax_t size = 0;
        std::filesystem::file_time_type mtime;
    };

    void poll_loop();

    std::string dir_;
    TranscriptEvents& events_;
    uint32_t poll_interval_ms_;
    std::string extension_;
    Logger* log_;

    std::mutex scan_mutex_;
    std::unordered_map<std::string, FileState> known_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread thread_;
};

} // namespace trelay
