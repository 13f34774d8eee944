#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

namespace xylo {

// Reducer settings taken from the process environment. Unset or malformed
// variables leave the field empty so callers keep their own defaults.
struct ReduceEnv {
    std::optional<std::size_t> maxDepth;   // XYLO_MAX_DEPTH
    std::optional<unsigned> threads;       // XYLO_THREADS
    bool noCache = false;                  // XYLO_NO_CACHE=1
    bool trace = false;                    // XYLO_TRACE=1
    std::optional<std::uint32_t> width;    // XYLO_WIDTH
    std::optional<std::uint32_t> height;   // XYLO_HEIGHT
};

ReduceEnv detect_env();

// True when the variable is set to 1/y/t (any case for the letters).
bool env_flag_enabled(const char* name);

} // namespace xylo
