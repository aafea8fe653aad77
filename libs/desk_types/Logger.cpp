#include "Logger.hpp"

#include <utility>

namespace desk_types {

StreamLogger::StreamLogger(LogLevel min_level, std::ostream& out, std::ostream& err)
    : min_level_(min_level), out_(out), err_(err) {}

void StreamLogger::log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;

    std::ostream& stream = (level >= LogLevel::Warn) ? err_ : out_;
    stream << "[" << component << "] " << message << "\n";
}

void StreamLogger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel StreamLogger::min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

std::shared_ptr<Logger> logger_or_null(std::shared_ptr<Logger> logger) {
    if (logger) return logger;
    return std::make_shared<NullLogger>();
}

} // namespace desk_types
