// diagnostics_json.hpp - JSON serialization for LinkResult
#pragma once
#include "rlink/errors.hpp"
#include <string>

namespace rlink {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string.
std::string diagnostics_to_json(const LinkResult& r);

// If RLINK_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const LinkResult& r);

} // namespace rlink
