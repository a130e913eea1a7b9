#include "log.hpp"

#include <iostream>
#include <utility>

namespace trelay {

StreamLogger::StreamLogger(std::string tag)
    : tag_(std::move(tag)), out_(std::cerr)
{}

StreamLogger::StreamLogger(std::string tag, std::ostream& out)
    : tag_(std::move(tag)), out_(out)
{}

void StreamLogger::info(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << tag_ << "] " << msg << "\n";
}

void StreamLogger::warn(const std::string& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[" << tag_ << "] Warning: " << msg << "\n";
}

} // namespace trelay
