#include "envsync/log.hpp"
#include <cstdarg>
#include <cstdio>

namespace envsync {

static LogLevel g_level = LogLevel::Info;

void set_log_level(LogLevel level){ g_level = level; }
LogLevel log_level(){ return g_level; }

bool log_enabled(LogLevel level){
    return level != LogLevel::Off && g_level != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(g_level);
}

const char* to_string(LogLevel level){
    switch(level){
        case LogLevel::Off: return "off";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Trace: return "trace";
    }
    return "?";
}

void log_msg(LogLevel level, const char* fmt, ...){
    if(!log_enabled(level)) return;
    std::fprintf(stderr, "[envsync][%s] ", to_string(level));
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fputc('\n', stderr);
}

} // namespace envsync
