// diagnostics_json.hpp - JSON serialization for collected diagnostics
#pragma once
#include "sprig/diagnostics.hpp"
#include <string>

namespace sprig {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const diagnostic_list& diagnostics);

// If SPRIG_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const diagnostic_list& diagnostics);

} // namespace sprig
