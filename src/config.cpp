#include "envsync/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace envsync {

std::optional<LogLevel> parse_log_level(std::string_view s){
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if(v == "off") return LogLevel::Off;
    if(v == "info") return LogLevel::Info;
    if(v == "debug") return LogLevel::Debug;
    if(v == "trace") return LogLevel::Trace;
    return std::nullopt;
}

LogLevel level_from_verbosity(int count){
    if(count <= 0) return LogLevel::Info;
    if(count == 1) return LogLevel::Debug;
    return LogLevel::Trace;
}

// Reads process env vars and constructs a SyncEnv.
SyncEnv detectEnv(){
    SyncEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("ENVSYNC_LOG")) e.logLevel = parse_log_level(v);

    if (const char* v = get("ENVSYNC_DIAG_JSON")) e.diagJson = (std::string(v) == "1");

    return e;
}

} // namespace envsync
