// Builtin function registry
#pragma once
#include "xylo/cache.hpp"
#include "xylo/value.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace xylo {

// Everything a builtin may touch besides its arguments.
struct CallContext {
    std::string_view name; // name the builtin was called by
    Cache& cache;
    std::uint32_t width = 400;
    std::uint32_t height = 400;
};

using BuiltinFn = Value (*)(const CallContext& ctx, const std::vector<Value>& args);

struct Builtin {
    BuiltinFn fn = nullptr;
    std::size_t arity = 0;
    bool pure = true; // false when the result depends on the generator
};

// nullptr when no builtin has that name.
const Builtin* find_builtin(std::string_view name);

// Checks the argument count, then dispatches.
Value call_builtin(const Builtin& b, const CallContext& ctx, const std::vector<Value>& args);

std::vector<std::string_view> builtin_names();

} // namespace xylo
