// diagnostics_json.hpp - JSON rendering of sync failures
#pragma once
#include "envsync/sync.hpp"
#include <string>

namespace envsync {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize a sync failure to a compact JSON string.
std::string diagnostics_to_json(const sync_error& e);

// If ENVSYNC_DIAG_JSON=1 in the environment, print the diagnostic JSON to stderr.
void maybe_print_json(const sync_error& e);

} // namespace envsync
