#include "arbor/logger.h"

#include <ctime>
#include <iomanip>
#include <iostream>

namespace arbor {

std::string_view to_string(Logger::Level level) noexcept {
    switch (level) {
        case Logger::Level::Error:
            return "error";
        case Logger::Level::Warning:
            return "warn";
        case Logger::Level::Info:
            return "info";
        case Logger::Level::Debug:
            return "debug";
        case Logger::Level::Trace:
            return "trace";
    }
    return "unknown";
}

Logger::Logger()
    : stream_{&std::clog}, level_{Level::Error} {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(Level level) noexcept {
    level_.store(level, std::memory_order_relaxed);
}

Logger::Level Logger::level() const noexcept {
    return level_.load(std::memory_order_relaxed);
}

void Logger::set_output(std::ostream* stream) noexcept {
    std::scoped_lock lock{mutex_};
    stream_ = stream != nullptr ? stream : &std::clog;
}

void Logger::write(Level level, std::string_view message) {
    std::scoped_lock lock{mutex_};
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&seconds, &tm);
    (*stream_) << std::put_time(&tm, "%H:%M:%S") << ' ' << to_string(level) << " | " << message << '\n';
}

} // namespace arbor
