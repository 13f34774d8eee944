#include "builtins_internal.hpp"

namespace xylo::builtins {

namespace {

bool equal_values(const CallContext& c, const Value& x, const Value& y){
    if(x.is_integer() && y.is_integer()) return x.as_integer() == y.as_integer();
    if(x.is_number() && y.is_number()) return num(c, x) == num(c, y);
    if(x.is_boolean() && y.is_boolean()) return x.as_boolean() == y.as_boolean();
    bad_argument(c);
}

// Integers compare exactly; any float operand promotes both.
template<typename Cmp>
Value ordered(const CallContext& c, const Args& a, Cmp cmp){
    if(a[0].is_integer() && a[1].is_integer()) return Value(cmp(a[0].as_integer(), a[1].as_integer()));
    return Value(cmp(num(c, a[0]), num(c, a[1])));
}

Value eq_fn(const CallContext& c, const Args& a){ return Value(equal_values(c, a[0], a[1])); }
Value neq_fn(const CallContext& c, const Args& a){ return Value(!equal_values(c, a[0], a[1])); }
Value lt_fn(const CallContext& c, const Args& a){ return ordered(c, a, [](auto x, auto y){ return x < y; }); }
Value lte_fn(const CallContext& c, const Args& a){ return ordered(c, a, [](auto x, auto y){ return x <= y; }); }
Value gt_fn(const CallContext& c, const Args& a){ return ordered(c, a, [](auto x, auto y){ return x > y; }); }
Value gte_fn(const CallContext& c, const Args& a){ return ordered(c, a, [](auto x, auto y){ return x >= y; }); }
Value and_fn(const CallContext& c, const Args& a){ return Value(boolean(c, a[0]) && boolean(c, a[1])); }
Value or_fn(const CallContext& c, const Args& a){ return Value(boolean(c, a[0]) || boolean(c, a[1])); }
Value not_fn(const CallContext& c, const Args& a){ return Value(!boolean(c, a[0])); }

} // namespace

void register_compare(Table& t){
    add(t, "==", eq_fn, 2);  add(t, "eq", eq_fn, 2);
    add(t, "!=", neq_fn, 2); add(t, "neq", neq_fn, 2);
    add(t, "<", lt_fn, 2);   add(t, "lt", lt_fn, 2);
    add(t, "<=", lte_fn, 2); add(t, "lte", lte_fn, 2);
    add(t, ">", gt_fn, 2);   add(t, "gt", gt_fn, 2);
    add(t, ">=", gte_fn, 2); add(t, "gte", gte_fn, 2);
    add(t, "&&", and_fn, 2); add(t, "and", and_fn, 2);
    add(t, "||", or_fn, 2);  add(t, "or", or_fn, 2);
    add(t, "not", not_fn, 1);
}

} // namespace xylo::builtins
