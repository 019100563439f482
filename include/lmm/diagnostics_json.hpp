// diagnostics_json.hpp - JSON serialization for ParseResult diagnostics
#pragma once
#include "lmm/parser.hpp"
#include <string>

namespace lmm {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// Serialize diagnostics to a compact JSON string. Ranges use the line and
// UTF-16 column, the way editor protocols address text.
std::string diagnostics_to_json(const ParseResult& r);

// If LMM_DIAG_JSON=1 in the environment, print diagnostics JSON to stderr.
void maybe_print_json(const ParseResult& r);

} // namespace lmm
