#include "vista/logging.h"

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace vista {

namespace {

std::atomic<uint8_t> s_level{static_cast<uint8_t>(LogLevel::Warn)};

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

Logger::Sink& sink() {
    static Logger::Sink s;
    return s;
}

} // anonymous namespace

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "error";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "unknown";
}

void Logger::SetLevel(LogLevel level) {
    s_level.store(static_cast<uint8_t>(level));
}

LogLevel Logger::Level() {
    return static_cast<LogLevel>(s_level.load());
}

void Logger::SetSink(Sink s) {
    std::lock_guard<std::mutex> lk(sink_mutex());
    sink() = std::move(s);
}

void Logger::Emit(LogLevel level, const std::string& msg) {
    // Run the sink unlocked; it may log or replace itself.
    Sink s;
    {
        std::lock_guard<std::mutex> lk(sink_mutex());
        s = sink();
    }
    if (s) {
        s(level, msg);
        return;
    }
    fmt::print(stderr, "[vista {}] {}\n", log_level_name(level), msg);
}

} // namespace vista
