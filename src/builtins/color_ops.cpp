#include "builtins_internal.hpp"
#include <optional>

namespace xylo::builtins {

namespace {

Value hsl_fn(const CallContext& c, const Args& a){
    return Value(set_hsla(shape(c, a[3]), num(c, a[0]), num(c, a[1]), num(c, a[2]), std::nullopt));
}

Value hsla_fn(const CallContext& c, const Args& a){
    return Value(set_hsla(shape(c, a[4]), num(c, a[0]), num(c, a[1]), num(c, a[2]), num(c, a[3])));
}

Value hue_fn(const CallContext& c, const Args& a){ return Value(set_hsla(shape(c, a[1]), num(c, a[0]), std::nullopt, std::nullopt, std::nullopt)); }
Value sat_fn(const CallContext& c, const Args& a){ return Value(set_hsla(shape(c, a[1]), std::nullopt, num(c, a[0]), std::nullopt, std::nullopt)); }
Value light_fn(const CallContext& c, const Args& a){ return Value(set_hsla(shape(c, a[1]), std::nullopt, std::nullopt, num(c, a[0]), std::nullopt)); }
Value alpha_fn(const CallContext& c, const Args& a){ return Value(set_hsla(shape(c, a[1]), std::nullopt, std::nullopt, std::nullopt, num(c, a[0]))); }

Value hshift_fn(const CallContext& c, const Args& a){ return Value(shift_hsla(shape(c, a[1]), num(c, a[0]), 0, 0, 0)); }
Value satshift_fn(const CallContext& c, const Args& a){ return Value(shift_hsla(shape(c, a[1]), 0, num(c, a[0]), 0, 0)); }
Value lshift_fn(const CallContext& c, const Args& a){ return Value(shift_hsla(shape(c, a[1]), 0, 0, num(c, a[0]), 0)); }
Value ashift_fn(const CallContext& c, const Args& a){ return Value(shift_hsla(shape(c, a[1]), 0, 0, 0, num(c, a[0]))); }

// hex #rrggbb shape; the color literal arrives packed as 0xRRGGBB
Value hex_fn(const CallContext& c, const Args& a){
    std::int32_t packed = integer(c, a[0]);
    if(packed < 0 || packed > 0xffffff) bad_argument(c);
    return Value(set_hex(shape(c, a[1]), static_cast<std::uint8_t>(packed >> 16),
                         static_cast<std::uint8_t>(packed >> 8), static_cast<std::uint8_t>(packed)));
}

} // namespace

void register_color(Table& t){
    add(t, "hsl", hsl_fn, 4);
    add(t, "hsla", hsla_fn, 5);
    add(t, "h", hue_fn, 2);     add(t, "hue", hue_fn, 2);
    add(t, "sat", sat_fn, 2);   add(t, "saturation", sat_fn, 2);
    add(t, "l", light_fn, 2);   add(t, "lightness", light_fn, 2);
    add(t, "a", alpha_fn, 2);   add(t, "alpha", alpha_fn, 2);
    add(t, "hshift", hshift_fn, 2);
    add(t, "satshift", satshift_fn, 2);
    add(t, "lshift", lshift_fn, 2);
    add(t, "ashift", ashift_fn, 2);
    add(t, "hex", hex_fn, 2);
}

} // namespace xylo::builtins
