// Environment-driven configuration
#pragma once
#include "lmm/parser.hpp"

namespace lmm {

// True when the variable is set to 1/t/T/y/Y.
bool env_flag_enabled(const char* name);

// Reads LMM_SPACE_WIDTH and LMM_TAB_WIDTH on top of the defaults.
// Values that are not non-negative integers are ignored.
ParseOptions options_from_env();

} // namespace lmm
