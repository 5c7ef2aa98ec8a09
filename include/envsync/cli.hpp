// Command line front end of the envsync tool
#pragma once
#include "envsync/config.hpp"
#include "envsync/log.hpp"
#include "envsync/sync.hpp"
#include <iosfwd>
#include <optional>

namespace envsync {

struct CliOptions {
    SyncOptions sync;
    int verbose = 0;      // -v / --verbose occurrences, -vv counts two
    bool help = false;
    bool version = false;
};

void print_usage(std::ostream& os);

// Parse argv (argv[0] is the program name). Returns nullopt on a usage error
// after writing the message and usage text to err.
std::optional<CliOptions> parse_args(int argc, const char* const* argv, std::ostream& err);

// ENVSYNC_LOG wins over the -v count.
LogLevel effective_log_level(const CliOptions& opts, const SyncEnv& env);

// Whole tool run. Exit status: 0 success, 1 sync error, 2 usage error.
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace envsync
