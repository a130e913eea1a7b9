#pragma once
#include <string>
#include <mutex>
#include <ostream>

namespace trelay {

// Minimal logging seam. Components take a Logger* and treat nullptr as
// "don't log".
class Logger {
public:
    virtual ~Logger() = default;
    virtual void info(const std::string& msg) = 0;
    virtual void warn(const std::string& msg) = 0;
};

// Writes "[tag] msg" / "[tag] Warning: msg" lines, stderr by default.
class StreamLogger : public Logger {
public:
    explicit StreamLogger(std::string tag);
    StreamLogger(std::string tag, std::ostream& out);

    void info(const std::string& msg) override;
    void warn(const std::string& msg) override;

private:
    std::string tag_;
    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace trelay
