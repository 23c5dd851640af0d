#include "common/logging.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace bayeskit {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::WARN)};
std::mutex g_log_mutex;

std::string utcTimestamp() {
    using clock = std::chrono::system_clock;
    std::time_t tt = clock::to_time_t(clock::now());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace

const char* levelTag(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void setLogLevel(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel getLogLevel() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool shouldLog(LogLevel level) noexcept {
    return static_cast<int>(level) >= g_level.load(std::memory_order_relaxed);
}

void log(LogLevel level, const std::string& msg) noexcept {
    if (!shouldLog(level)) return;
    try {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::ostream& out = (level >= LogLevel::WARN) ? std::cerr : std::cout;
        out << "[" << utcTimestamp() << "][" << levelTag(level) << "] "
            << msg << "\n";
        out.flush();
    } catch (const std::exception&) {
        // Logging must not throw into numeric code; the message is lost.
    }
}

} // namespace bayeskit
