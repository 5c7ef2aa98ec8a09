// Leveled diagnostic lines on stderr ("[envsync][debug] ...").
#pragma once

namespace envsync {

enum class LogLevel { Off, Info, Debug, Trace };

// Process-wide threshold; set once by the CLI before any work starts.
void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);
const char* to_string(LogLevel level);

// printf-style message, dropped when the level is above the threshold.
void log_msg(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace envsync
