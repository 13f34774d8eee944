// diagnostics_json.hpp - JSON rendering of parse and reduce errors
#pragma once
#include "xylo/error.hpp"
#include <string>

namespace xylo {

// Escape a string for safe JSON output.
std::string json_escape(const std::string& s);

// {"code","kind","message","name","line","col"}; line/col are -1 outside the parser.
std::string error_to_json(const error& e);

// If XYLO_DIAG_JSON=1 in the environment, print the error JSON to stderr.
void maybe_print_json(const error& e);

} // namespace xylo
