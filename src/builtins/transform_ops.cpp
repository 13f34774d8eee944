#include "builtins_internal.hpp"

namespace xylo::builtins {

namespace {

// Every transform takes its parameters first and the shape last.
Value translate_fn(const CallContext& c, const Args& a){ return Value(translate(shape(c, a[2]), num(c, a[0]), num(c, a[1]))); }
Value translate_x_fn(const CallContext& c, const Args& a){ return Value(translate(shape(c, a[1]), num(c, a[0]), 0.0f)); }
Value translate_y_fn(const CallContext& c, const Args& a){ return Value(translate(shape(c, a[1]), 0.0f, num(c, a[0]))); }
Value translate_both_fn(const CallContext& c, const Args& a){ float d = num(c, a[0]); return Value(translate(shape(c, a[1]), d, d)); }

Value rotate_fn(const CallContext& c, const Args& a){ return Value(rotate(shape(c, a[1]), num(c, a[0]))); }
Value rotate_at_fn(const CallContext& c, const Args& a){ return Value(rotate_at(shape(c, a[3]), num(c, a[0]), num(c, a[1]), num(c, a[2]))); }

Value scale_fn(const CallContext& c, const Args& a){ return Value(scale(shape(c, a[2]), num(c, a[0]), num(c, a[1]))); }
Value scale_x_fn(const CallContext& c, const Args& a){ return Value(scale(shape(c, a[1]), num(c, a[0]), 1.0f)); }
Value scale_y_fn(const CallContext& c, const Args& a){ return Value(scale(shape(c, a[1]), 1.0f, num(c, a[0]))); }
Value scale_both_fn(const CallContext& c, const Args& a){ float f = num(c, a[0]); return Value(scale(shape(c, a[1]), f, f)); }

Value skew_fn(const CallContext& c, const Args& a){ return Value(skew(shape(c, a[2]), num(c, a[0]), num(c, a[1]))); }
Value skew_x_fn(const CallContext& c, const Args& a){ return Value(skew(shape(c, a[1]), num(c, a[0]), 0.0f)); }
Value skew_y_fn(const CallContext& c, const Args& a){ return Value(skew(shape(c, a[1]), 0.0f, num(c, a[0]))); }
Value skew_both_fn(const CallContext& c, const Args& a){ float k = num(c, a[0]); return Value(skew(shape(c, a[1]), k, k)); }

Value flip_fn(const CallContext& c, const Args& a){ return Value(flip(shape(c, a[1]), num(c, a[0]))); }
Value flip_h_fn(const CallContext& c, const Args& a){ return Value(flip_h(shape(c, a[0]))); }
Value flip_v_fn(const CallContext& c, const Args& a){ return Value(flip_v(shape(c, a[0]))); }
Value flip_d_fn(const CallContext& c, const Args& a){ return Value(flip_d(shape(c, a[0]))); }

Value zindex_fn(const CallContext& c, const Args& a){ return Value(set_zindex(shape(c, a[1]), num(c, a[0]))); }
Value zshift_fn(const CallContext& c, const Args& a){ return Value(shift_zindex(shape(c, a[1]), num(c, a[0]))); }

} // namespace

void register_transform(Table& t){
    add(t, "t", translate_fn, 3);  add(t, "translate", translate_fn, 3);
    add(t, "tx", translate_x_fn, 2);
    add(t, "ty", translate_y_fn, 2);
    add(t, "tt", translate_both_fn, 2);
    add(t, "r", rotate_fn, 2);     add(t, "rotate", rotate_fn, 2);
    add(t, "ra", rotate_at_fn, 4); add(t, "rotate_at", rotate_at_fn, 4);
    add(t, "s", scale_fn, 3);      add(t, "scale", scale_fn, 3);
    add(t, "sx", scale_x_fn, 2);
    add(t, "sy", scale_y_fn, 2);
    add(t, "ss", scale_both_fn, 2);
    add(t, "k", skew_fn, 3);       add(t, "skew", skew_fn, 3);
    add(t, "kx", skew_x_fn, 2);
    add(t, "ky", skew_y_fn, 2);
    add(t, "kk", skew_both_fn, 2);
    add(t, "flip", flip_fn, 2);
    add(t, "fh", flip_h_fn, 1);
    add(t, "fv", flip_v_fn, 1);
    add(t, "fd", flip_d_fn, 1);
    add(t, "z", zindex_fn, 2);     add(t, "zindex", zindex_fn, 2);
    add(t, "zshift", zshift_fn, 2);
}

} // namespace xylo::builtins
