#include "builtins_internal.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace xylo::builtins {

namespace {

constexpr float kPi = 3.14159265358979323846f;

// Two's complement wrap for 32-bit integer arithmetic.
std::int32_t wrap(std::int64_t v){ return static_cast<std::int32_t>(static_cast<std::uint32_t>(static_cast<std::uint64_t>(v))); }

template<typename IntOp, typename FloatOp>
Value arith(const CallContext& c, const Args& a, IntOp iop, FloatOp fop){
    if(a[0].is_integer() && a[1].is_integer()) return iop(a[0].as_integer(), a[1].as_integer());
    return Value(fop(num(c, a[0]), num(c, a[1])));
}

Value add_fn(const CallContext& c, const Args& a){
    return arith(c, a, [](std::int32_t x, std::int32_t y){ return Value(wrap(std::int64_t(x) + y)); },
                       [](float x, float y){ return x + y; });
}

Value sub_fn(const CallContext& c, const Args& a){
    return arith(c, a, [](std::int32_t x, std::int32_t y){ return Value(wrap(std::int64_t(x) - y)); },
                       [](float x, float y){ return x - y; });
}

Value mul_fn(const CallContext& c, const Args& a){
    return arith(c, a, [](std::int32_t x, std::int32_t y){ return Value(wrap(std::int64_t(x) * y)); },
                       [](float x, float y){ return x * y; });
}

Value div_fn(const CallContext& c, const Args& a){
    return arith(c, a, [&](std::int32_t x, std::int32_t y){
                           if(y == 0) bad_argument(c);
                           return Value(wrap(std::int64_t(x) / y));
                       },
                       [](float x, float y){ return x / y; });
}

Value mod_fn(const CallContext& c, const Args& a){
    return arith(c, a, [&](std::int32_t x, std::int32_t y){
                           if(y == 0) bad_argument(c);
                           return Value(wrap(std::int64_t(x) % y));
                       },
                       [](float x, float y){ return std::fmod(x, y); });
}

Value pow_fn(const CallContext& c, const Args& a){ return Value(std::pow(num(c, a[0]), num(c, a[1]))); }

Value neg_fn(const CallContext& c, const Args& a){
    if(a[0].is_integer()) return Value(wrap(-std::int64_t(a[0].as_integer())));
    return Value(-num(c, a[0]));
}

Value int_fn(const CallContext& c, const Args& a){
    if(a[0].is_integer()) return a[0];
    float f = num(c, a[0]);
    if(!std::isfinite(f) || f >= 2147483648.0f || f < -2147483648.0f) bad_argument(c);
    return Value(static_cast<std::int32_t>(f));
}

Value float_fn(const CallContext& c, const Args& a){ return Value(num(c, a[0])); }

Value pi_fn(const CallContext&, const Args&){ return Value(kPi); }
Value tau_fn(const CallContext&, const Args&){ return Value(2.0f * kPi); }
Value e_fn(const CallContext&, const Args&){ return Value(2.71828182845904523536f); }
Value phi_fn(const CallContext&, const Args&){ return Value(1.61803398874989484820f); }

template<float (*F)(float)>
Value unary(const CallContext& c, const Args& a){ return Value(F(num(c, a[0]))); }

float f_sin(float x){ return std::sin(x); }
float f_cos(float x){ return std::cos(x); }
float f_tan(float x){ return std::tan(x); }
float f_asin(float x){ return std::asin(x); }
float f_acos(float x){ return std::acos(x); }
float f_atan(float x){ return std::atan(x); }
float f_sinh(float x){ return std::sinh(x); }
float f_cosh(float x){ return std::cosh(x); }
float f_tanh(float x){ return std::tanh(x); }
float f_asinh(float x){ return std::asinh(x); }
float f_acosh(float x){ return std::acosh(x); }
float f_atanh(float x){ return std::atanh(x); }
float f_sqrt(float x){ return std::sqrt(x); }
float f_cbrt(float x){ return std::cbrt(x); }
float f_ln(float x){ return std::log(x); }
float f_log10(float x){ return std::log10(x); }
float f_deg(float x){ return x * 180.0f / kPi; }
float f_rad(float x){ return x * kPi / 180.0f; }

Value atan2_fn(const CallContext& c, const Args& a){ return Value(std::atan2(num(c, a[0]), num(c, a[1]))); }

// log base x
Value log_fn(const CallContext& c, const Args& a){ return Value(std::log(num(c, a[1])) / std::log(num(c, a[0]))); }

Value abs_fn(const CallContext& c, const Args& a){
    if(a[0].is_integer()) return Value(wrap(std::llabs(a[0].as_integer())));
    return Value(std::fabs(num(c, a[0])));
}

template<float (*F)(float)>
Value rounding(const CallContext& c, const Args& a){
    if(a[0].is_integer()) return a[0];
    float f = F(num(c, a[0]));
    if(!std::isfinite(f) || f >= 2147483648.0f || f < -2147483648.0f) bad_argument(c);
    return Value(static_cast<std::int32_t>(f));
}

float f_floor(float x){ return std::floor(x); }
float f_ceil(float x){ return std::ceil(x); }
float f_round(float x){ return std::round(x); }

Value min_fn(const CallContext& c, const Args& a){
    return arith(c, a, [](std::int32_t x, std::int32_t y){ return Value(std::min(x, y)); },
                       [](float x, float y){ return std::min(x, y); });
}

Value max_fn(const CallContext& c, const Args& a){
    return arith(c, a, [](std::int32_t x, std::int32_t y){ return Value(std::max(x, y)); },
                       [](float x, float y){ return std::max(x, y); });
}

// clamp value lo hi
Value clamp_fn(const CallContext& c, const Args& a){
    if(a[0].is_integer() && a[1].is_integer() && a[2].is_integer()){
        std::int32_t lo = a[1].as_integer(), hi = a[2].as_integer();
        if(lo > hi) bad_argument(c);
        return Value(std::clamp(a[0].as_integer(), lo, hi));
    }
    float lo = num(c, a[1]), hi = num(c, a[2]);
    if(lo > hi) bad_argument(c);
    return Value(std::clamp(num(c, a[0]), lo, hi));
}

// lerp from to t
Value lerp_fn(const CallContext& c, const Args& a){
    float x = num(c, a[0]), y = num(c, a[1]), t = num(c, a[2]);
    return Value(x + (y - x) * t);
}

// Factorial argument; floats truncate.
std::int64_t factorial_arg(const CallContext& c, const Value& v){
    if(v.is_integer()){
        if(v.as_integer() < 0) throw make_error(ErrorKind::NegativeNumber);
        return v.as_integer();
    }
    float f = num(c, v);
    if(std::isnan(f)) bad_argument(c);
    if(f < 0.0f) throw make_error(ErrorKind::NegativeNumber);
    return static_cast<std::int64_t>(std::min(f, 64.0f));
}

// Product n * (n - step) * ... ; results past the Integer range are rejected.
Value falling_product(const CallContext& c, std::int64_t n, std::int64_t step){
    std::int64_t r = 1;
    for(std::int64_t i = n; i > 1; i -= step){
        r *= i;
        if(r > std::numeric_limits<std::int32_t>::max()) bad_argument(c);
    }
    return Value(static_cast<std::int32_t>(r));
}

Value fact_fn(const CallContext& c, const Args& a){ return falling_product(c, factorial_arg(c, a[0]), 1); }
Value fact2_fn(const CallContext& c, const Args& a){ return falling_product(c, factorial_arg(c, a[0]), 2); }

template<typename Op>
Value bitwise(const CallContext& c, const Args& a, Op op){
    return Value(static_cast<std::int32_t>(op(static_cast<std::uint32_t>(integer(c, a[0])), static_cast<std::uint32_t>(integer(c, a[1])))));
}

Value bitand_fn(const CallContext& c, const Args& a){ return bitwise(c, a, [](std::uint32_t x, std::uint32_t y){ return x & y; }); }
Value bitor_fn(const CallContext& c, const Args& a){ return bitwise(c, a, [](std::uint32_t x, std::uint32_t y){ return x | y; }); }
Value bitxor_fn(const CallContext& c, const Args& a){ return bitwise(c, a, [](std::uint32_t x, std::uint32_t y){ return x ^ y; }); }
Value bitnot_fn(const CallContext& c, const Args& a){ return Value(static_cast<std::int32_t>(~static_cast<std::uint32_t>(integer(c, a[0])))); }

// Shift counts outside 0..31 are rejected; right shifts keep the sign.
Value bitleft_fn(const CallContext& c, const Args& a){
    std::int32_t x = integer(c, a[0]), n = integer(c, a[1]);
    if(n < 0 || n > 31) bad_argument(c);
    return Value(static_cast<std::int32_t>(static_cast<std::uint32_t>(x) << n));
}

Value bitright_fn(const CallContext& c, const Args& a){
    std::int32_t x = integer(c, a[0]), n = integer(c, a[1]);
    if(n < 0 || n > 31) bad_argument(c);
    return Value(x < 0 ? ~(~x >> n) : x >> n);
}

} // namespace

void register_math(Table& t){
    add(t, "+", add_fn, 2);   add(t, "add", add_fn, 2);
    add(t, "-", sub_fn, 2);   add(t, "sub", sub_fn, 2);
    add(t, "*", mul_fn, 2);   add(t, "mul", mul_fn, 2);
    add(t, "/", div_fn, 2);   add(t, "div", div_fn, 2);
    add(t, "%", mod_fn, 2);   add(t, "mod", mod_fn, 2);
    add(t, "**", pow_fn, 2);  add(t, "pow", pow_fn, 2);
    add(t, "neg", neg_fn, 1);
    add(t, "int", int_fn, 1);
    add(t, "float", float_fn, 1);
    add(t, "pi", pi_fn, 0);
    add(t, "tau", tau_fn, 0);
    add(t, "e", e_fn, 0);
    add(t, "phi", phi_fn, 0);
    add(t, "sin", unary<f_sin>, 1);
    add(t, "cos", unary<f_cos>, 1);
    add(t, "tan", unary<f_tan>, 1);
    add(t, "asin", unary<f_asin>, 1);
    add(t, "acos", unary<f_acos>, 1);
    add(t, "atan", unary<f_atan>, 1);
    add(t, "atan2", atan2_fn, 2);
    add(t, "sinh", unary<f_sinh>, 1);
    add(t, "cosh", unary<f_cosh>, 1);
    add(t, "tanh", unary<f_tanh>, 1);
    add(t, "asinh", unary<f_asinh>, 1);
    add(t, "acosh", unary<f_acosh>, 1);
    add(t, "atanh", unary<f_atanh>, 1);
    add(t, "sqrt", unary<f_sqrt>, 1);
    add(t, "cbrt", unary<f_cbrt>, 1);
    add(t, "ln", unary<f_ln>, 1);
    add(t, "log10", unary<f_log10>, 1);
    add(t, "log", log_fn, 2);
    add(t, "abs", abs_fn, 1);
    add(t, "floor", rounding<f_floor>, 1);
    add(t, "ceil", rounding<f_ceil>, 1);
    add(t, "round", rounding<f_round>, 1);
    add(t, "min", min_fn, 2);
    add(t, "max", max_fn, 2);
    add(t, "clamp", clamp_fn, 3);
    add(t, "lerp", lerp_fn, 3);
    add(t, "deg_to_rad", unary<f_rad>, 1);
    add(t, "rad_to_deg", unary<f_deg>, 1);
    add(t, "fact", fact_fn, 1);
    add(t, "fact2", fact2_fn, 1);
    add(t, "bitand", bitand_fn, 2);
    add(t, "bitor", bitor_fn, 2);
    add(t, "bitxor", bitxor_fn, 2);
    add(t, "bitnot", bitnot_fn, 1);
    add(t, "bitleft", bitleft_fn, 2);
    add(t, "bitright", bitright_fn, 2);
}

} // namespace xylo::builtins
