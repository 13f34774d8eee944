#include "xylo/env.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace xylo {

namespace {

const char* get(const char* k){ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; }

std::optional<unsigned long long> get_unsigned(const char* k){
    const char* v = get(k);
    if(!v || *v == '-') return std::nullopt;
    errno = 0;
    char* end = nullptr;
    unsigned long long n = std::strtoull(v, &end, 10);
    if(errno != 0 || end == v || *end != '\0') return std::nullopt;
    return n;
}

} // namespace

bool env_flag_enabled(const char* name){
    const char* v = get(name);
    if(!v) return false;
    return v[0]=='1' || v[0]=='y' || v[0]=='Y' || v[0]=='t' || v[0]=='T';
}

ReduceEnv detect_env(){
    ReduceEnv e{};
    if(auto n = get_unsigned("XYLO_MAX_DEPTH"); n && *n > 0) e.maxDepth = static_cast<std::size_t>(*n);
    if(auto n = get_unsigned("XYLO_THREADS"); n && *n <= std::numeric_limits<unsigned>::max()) e.threads = static_cast<unsigned>(*n);
    e.noCache = env_flag_enabled("XYLO_NO_CACHE");
    e.trace = env_flag_enabled("XYLO_TRACE");
    if(auto n = get_unsigned("XYLO_WIDTH"); n && *n > 0 && *n <= std::numeric_limits<std::uint32_t>::max()) e.width = static_cast<std::uint32_t>(*n);
    if(auto n = get_unsigned("XYLO_HEIGHT"); n && *n > 0 && *n <= std::numeric_limits<std::uint32_t>::max()) e.height = static_cast<std::uint32_t>(*n);
    return e;
}

} // namespace xylo
