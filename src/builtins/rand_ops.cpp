#include "builtins_internal.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>

namespace xylo::builtins {

namespace {

Value rand_fn(const CallContext& c, const Args&){
    return Value(c.cache.with_rng([](Cache::Rng& rng){ return std::uniform_real_distribution<float>(0.0f, 1.0f)(rng); }));
}

Value randi_fn(const CallContext& c, const Args&){
    return Value(c.cache.with_rng([](Cache::Rng& rng){ return static_cast<std::int32_t>(rng() & 1); }));
}

// Float in [from, to)
Value rand_range_fn(const CallContext& c, const Args& a){
    float from = num(c, a[0]), to = num(c, a[1]);
    if(!(from < to)) bad_argument(c);
    return Value(c.cache.with_rng([&](Cache::Rng& rng){ return std::uniform_real_distribution<float>(from, to)(rng); }));
}

// Float in [from, to]
Value rand_rangei_fn(const CallContext& c, const Args& a){
    float from = num(c, a[0]), to = num(c, a[1]);
    if(!(from <= to) || !std::isfinite(from) || !std::isfinite(to)) bad_argument(c);
    if(from == to) return Value(from);
    float past = std::nextafter(to, std::numeric_limits<float>::infinity());
    return Value(c.cache.with_rng([&](Cache::Rng& rng){ return std::uniform_real_distribution<float>(from, past)(rng); }));
}

// Integer bound; floats truncate and must fit the Integer range.
std::int32_t int_bound(const CallContext& c, const Value& v){
    if(v.is_integer()) return v.as_integer();
    float f = num(c, v);
    if(!std::isfinite(f) || f >= 2147483648.0f || f < -2147483648.0f) bad_argument(c);
    return static_cast<std::int32_t>(f);
}

// Integer in [from, to)
Value randi_range_fn(const CallContext& c, const Args& a){
    std::int32_t from = int_bound(c, a[0]), to = int_bound(c, a[1]);
    if(from >= to) bad_argument(c);
    return Value(c.cache.with_rng([&](Cache::Rng& rng){ return std::uniform_int_distribution<std::int32_t>(from, to - 1)(rng); }));
}

// Integer in [from, to]
Value randi_rangei_fn(const CallContext& c, const Args& a){
    std::int32_t from = int_bound(c, a[0]), to = int_bound(c, a[1]);
    if(from > to) bad_argument(c);
    return Value(c.cache.with_rng([&](Cache::Rng& rng){ return std::uniform_int_distribution<std::int32_t>(from, to)(rng); }));
}

Value shuffle_fn(const CallContext& c, const Args& a){
    auto items = list(c, a[0]);
    c.cache.with_rng([&](Cache::Rng& rng){ std::shuffle(items.begin(), items.end(), rng); });
    return Value::list(std::move(items));
}

Value choose_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    if(items.empty()) throw make_error(ErrorKind::OutOfBounds);
    std::size_t i = c.cache.with_rng([&](Cache::Rng& rng){ return std::uniform_int_distribution<std::size_t>(0, items.size() - 1)(rng); });
    return items[i];
}

} // namespace

void register_random(Table& t){
    add(t, "rand", rand_fn, 0, false);
    add(t, "randi", randi_fn, 0, false);
    add(t, "rand_range", rand_range_fn, 2, false);
    add(t, "randi_range", randi_range_fn, 2, false);
    add(t, "rand_rangei", rand_rangei_fn, 2, false);
    add(t, "randi_rangei", randi_rangei_fn, 2, false);
    add(t, "shuffle", shuffle_fn, 1, false);
    add(t, "choose", choose_fn, 1, false);
}

} // namespace xylo::builtins
