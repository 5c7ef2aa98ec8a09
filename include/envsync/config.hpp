#pragma once
#include "envsync/log.hpp"
#include <optional>
#include <string_view>

namespace envsync {

struct SyncEnv {
    std::optional<LogLevel> logLevel; // ENVSYNC_LOG; overrides -v when set
    bool diagJson = false;            // ENVSYNC_DIAG_JSON=1
};

// Read envsync settings from process env vars. Unknown values are ignored.
SyncEnv detectEnv();

// "off", "info", "debug" or "trace" (case-insensitive).
std::optional<LogLevel> parse_log_level(std::string_view s);

// -v count to level: 0 -> info, 1 -> debug, 2+ -> trace.
LogLevel level_from_verbosity(int count);

} // namespace envsync
