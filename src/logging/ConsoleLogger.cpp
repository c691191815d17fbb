#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

#include "ConsoleLogger.hpp"

namespace {
std::string utcTimestamp() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const std::time_t seconds = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm tm_utc{};
    gmtime_r(&seconds, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}
}

void ConsoleLogger::write(std::ostream& stream, const std::string& prefix, const std::string& message) {
    std::ostringstream line;
    line << utcTimestamp() << ' ' << prefix << "[" << std::this_thread::get_id() << "] " << message << '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    stream << line.str();
    stream.flush();
}

void ConsoleLogger::info(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::INFO) write(out_, LogUtils::INFO_LOG_PREFIX, message);
}

void ConsoleLogger::debug(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::DEBUG) write(out_, LogUtils::DEBUG_LOG_PREFIX, message);
}

void ConsoleLogger::warn(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::WARN) write(out_, LogUtils::WARN_LOG_PREFIX, message);
}

void ConsoleLogger::error(const std::string& message) {
    if (logLevel <= LogUtils::LogLevel::CERROR) write(err_, LogUtils::CERROR_LOG_PREFIX, message);
}

// Startup and shutdown milestones are printed at every level.
void ConsoleLogger::setup(const std::string& message) {
    write(out_, LogUtils::SETUP_LOG_PREFIX, message);
}
