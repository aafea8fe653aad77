#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace desk_types {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

// Logging collaborator injected into the transport, arbiter and Desk
// Messages are tagged with the emitting component ("Desk", "Transport", ...)
class Logger {
public:
    virtual ~Logger() = default;

    virtual void log(LogLevel level, const std::string& component, const std::string& message) = 0;

    void debug(const std::string& component, const std::string& message) {
        log(LogLevel::Debug, component, message);
    }
    void info(const std::string& component, const std::string& message) {
        log(LogLevel::Info, component, message);
    }
    void warn(const std::string& component, const std::string& message) {
        log(LogLevel::Warn, component, message);
    }
    void error(const std::string& component, const std::string& message) {
        log(LogLevel::Error, component, message);
    }
};

// Writes "[Component] message" lines; debug/info to out, warn/error to err
class StreamLogger : public Logger {
public:
    explicit StreamLogger(LogLevel min_level = LogLevel::Info,
                          std::ostream& out = std::cout,
                          std::ostream& err = std::cerr);

    void log(LogLevel level, const std::string& component, const std::string& message) override;

    void set_min_level(LogLevel level);
    LogLevel min_level() const;

private:
    mutable std::mutex mutex_;
    LogLevel min_level_;
    std::ostream& out_;
    std::ostream& err_;
};

// Discards everything
class NullLogger : public Logger {
public:
    void log(LogLevel, const std::string&, const std::string&) override {}
};

// Returns logger, or a NullLogger when logger is empty
std::shared_ptr<Logger> logger_or_null(std::shared_ptr<Logger> logger);

} // namespace desk_types
