#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"

// Line-oriented logger. Each line carries a UTC timestamp, the level prefix
// and the calling thread's id. Errors go to the error stream, everything
// else to the output stream.
class ConsoleLogger : public ILogger {
public:
    explicit ConsoleLogger(LogUtils::LogLevel logLevel,
                           std::ostream& out = std::cout,
                           std::ostream& err = std::cerr)
        : logLevel(logLevel), out_(out), err_(err) {}
    ~ConsoleLogger() override = default;

    void info(const std::string& message) override;
    void debug(const std::string& message) override;
    void warn(const std::string& message) override;
    void error(const std::string& message) override;
    void setup(const std::string& message) override;
    int getLogLevel() override { return logLevel; }

private:
    void write(std::ostream& stream, const std::string& prefix, const std::string& message);

    LogUtils::LogLevel logLevel;
    std::ostream& out_;
    std::ostream& err_;
    std::mutex write_mutex_; // both streams share one lock so lines never interleave

    ConsoleLogger(const ConsoleLogger&) = delete;
    ConsoleLogger& operator=(const ConsoleLogger&) = delete;
};
