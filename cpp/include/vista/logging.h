#pragma once

/// @file logging.h
/// Process-wide leveled logging, formatted with fmt.

#include <fmt/format.h>

#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace vista {

enum class LogLevel : uint8_t {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
    Trace = 4,
};

/// Short lowercase name of a level ("error", "warn", ...).
const char* log_level_name(LogLevel level);

/// Leveled logger shared by the whole process.
///
/// Usage:
/// @code
///     vista::Logger::Log(vista::LogLevel::Debug,
///                        "rewrote {} commits for {}", n, filter_id);
/// @endcode
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string&)>;

    /// Messages above this level are dropped. Defaults to Warn.
    static void SetLevel(LogLevel level);
    static LogLevel Level();

    /// Replace the output sink. Passing an empty function restores the
    /// default stderr sink.
    static void SetSink(Sink sink);

    static bool Enabled(LogLevel level) {
        return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Level());
    }

    template <typename... Args>
    static void Log(LogLevel level, fmt::format_string<Args...> fmt,
                    Args&&... args) {
        if (!Enabled(level)) return;
        Emit(level, fmt::format(fmt, std::forward<Args>(args)...));
    }

private:
    static void Emit(LogLevel level, const std::string& msg);
};

} // namespace vista
