#include "builtins_internal.hpp"
#include <algorithm>
#include <cmath>

namespace xylo::builtins {

namespace {

// Float range bound, truncated; NaN or out of the Integer range is rejected.
std::int64_t float_bound(const CallContext& c, float f){
    if(!std::isfinite(f) || f >= 2147483648.0f || f < -2147483648.0f) bad_argument(c);
    return static_cast<std::int32_t>(f);
}

Value make_range(const CallContext& c, const Args& a, bool inclusive){
    std::vector<Value> items;
    if(a[0].is_integer() && a[1].is_integer()){
        std::int64_t from = a[0].as_integer(), to = a[1].as_integer() + (inclusive ? 1 : 0);
        for(std::int64_t i = from; i < to; ++i) items.emplace_back(static_cast<std::int32_t>(i));
    } else if(a[0].is_float() && a[1].is_float()){
        std::int64_t from = float_bound(c, a[0].as_float());
        std::int64_t to = float_bound(c, a[1].as_float()) + (inclusive ? 1 : 0);
        for(std::int64_t i = from; i < to; ++i) items.emplace_back(static_cast<float>(i));
    } else {
        bad_argument(c);
    }
    return Value::list(std::move(items));
}

Value range_fn(const CallContext& c, const Args& a){ return make_range(c, a, false); }
Value rangei_fn(const CallContext& c, const Args& a){ return make_range(c, a, true); }

std::size_t index(const Value& v, std::size_t size, const CallContext& c){
    std::int32_t i = integer(c, v);
    if(i < 0 || static_cast<std::size_t>(i) >= size) throw make_error(ErrorKind::OutOfBounds);
    return static_cast<std::size_t>(i);
}

std::size_t count(const Value& v, const CallContext& c){
    std::int32_t n = integer(c, v);
    if(n < 0) throw make_error(ErrorKind::NegativeNumber);
    return static_cast<std::size_t>(n);
}

Value concat_fn(const CallContext& c, const Args& a){
    auto items = list(c, a[0]);
    auto& rhs = list(c, a[1]);
    items.insert(items.end(), rhs.begin(), rhs.end());
    return checked_list(std::move(items));
}

Value prepend_fn(const CallContext& c, const Args& a){
    std::vector<Value> items{a[0]};
    auto& rest = list(c, a[1]);
    items.insert(items.end(), rest.begin(), rest.end());
    return checked_list(std::move(items));
}

Value append_fn(const CallContext& c, const Args& a){
    auto items = list(c, a[0]);
    items.push_back(a[1]);
    return checked_list(std::move(items));
}

Value nth_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    return items[index(a[1], items.size(), c)];
}

Value set_fn(const CallContext& c, const Args& a){
    auto items = list(c, a[0]);
    items[index(a[1], items.size(), c)] = a[2];
    return checked_list(std::move(items));
}

Value length_fn(const CallContext& c, const Args& a){ return Value(static_cast<std::int32_t>(list(c, a[0]).size())); }
Value is_empty_fn(const CallContext& c, const Args& a){ return Value(list(c, a[0]).empty()); }

Value head_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    if(items.empty()) throw make_error(ErrorKind::OutOfBounds);
    return items.front();
}

Value last_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    if(items.empty()) throw make_error(ErrorKind::OutOfBounds);
    return items.back();
}

Value tail_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    if(items.empty()) throw make_error(ErrorKind::OutOfBounds);
    return Value::list(std::vector<Value>(items.begin() + 1, items.end()));
}

Value init_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    if(items.empty()) throw make_error(ErrorKind::OutOfBounds);
    return Value::list(std::vector<Value>(items.begin(), items.end() - 1));
}

Value contains_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    return Value(std::find(items.begin(), items.end(), a[1]) != items.end());
}

Value index_of_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    auto it = std::find(items.begin(), items.end(), a[1]);
    if(it == items.end()) throw make_error(ErrorKind::NotFound);
    return Value(static_cast<std::int32_t>(it - items.begin()));
}

Value take_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    std::size_t n = std::min(count(a[1], c), items.size());
    return Value::list(std::vector<Value>(items.begin(), items.begin() + n));
}

Value drop_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    std::size_t n = std::min(count(a[1], c), items.size());
    return Value::list(std::vector<Value>(items.begin() + n, items.end()));
}

// slice list from to, half-open
Value slice_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[0]);
    std::size_t from = count(a[1], c), to = count(a[2], c);
    if(from > to || to > items.size()) throw make_error(ErrorKind::OutOfBounds);
    return Value::list(std::vector<Value>(items.begin() + from, items.begin() + to));
}

Value reverse_fn(const CallContext& c, const Args& a){
    auto items = list(c, a[0]);
    std::reverse(items.begin(), items.end());
    return Value::list(std::move(items));
}

template<typename Op>
Value fold(const CallContext& c, const Args& a, std::int32_t unit, Op op){
    auto& items = list(c, a[0]);
    if(items.empty()) return Value(unit);
    if(items.front().is_integer()){
        std::int32_t acc = unit;
        for(auto& v : items) acc = static_cast<std::int32_t>(static_cast<std::uint32_t>(op(std::int64_t(acc), std::int64_t(integer(c, v)))));
        return Value(acc);
    }
    float acc = static_cast<float>(unit);
    for(auto& v : items){
        if(!v.is_float()) bad_argument(c);
        acc = op(acc, v.as_float());
    }
    return Value(acc);
}

Value sum_fn(const CallContext& c, const Args& a){ return fold(c, a, 0, [](auto x, auto y){ return x + y; }); }
Value product_fn(const CallContext& c, const Args& a){ return fold(c, a, 1, [](auto x, auto y){ return x * y; }); }

// Numeric lists only; Integer lists compare exactly.
bool numeric_less(const CallContext& c, const Value& x, const Value& y){
    if(x.is_integer() && y.is_integer()) return x.as_integer() < y.as_integer();
    return num(c, x) < num(c, y);
}

template<typename Pick>
Value extreme(const CallContext& c, const Args& a, Pick better){
    auto& items = list(c, a[0]);
    if(items.empty()) throw make_error(ErrorKind::OutOfBounds);
    const Value* best = &items.front();
    for(auto& v : items){
        num(c, v);
        if(better(v, *best)) best = &v;
    }
    return *best;
}

Value min_of_fn(const CallContext& c, const Args& a){
    return extreme(c, a, [&](const Value& v, const Value& best){ return numeric_less(c, v, best); });
}

Value max_of_fn(const CallContext& c, const Args& a){
    return extreme(c, a, [&](const Value& v, const Value& best){ return numeric_less(c, best, v); });
}

Value sort_fn(const CallContext& c, const Args& a){
    auto items = list(c, a[0]);
    for(auto& v : items) num(c, v);
    std::stable_sort(items.begin(), items.end(), [&](const Value& x, const Value& y){ return numeric_less(c, x, y); });
    return Value::list(std::move(items));
}

// Keeps the first occurrence of each value.
Value unique_fn(const CallContext& c, const Args& a){
    std::vector<Value> out;
    for(auto& v : list(c, a[0]))
        if(std::find(out.begin(), out.end(), v) == out.end()) out.push_back(v);
    return Value::list(std::move(out));
}

// One level: a list of lists becomes the concatenation of its items.
Value flatten_fn(const CallContext& c, const Args& a){
    std::vector<Value> out;
    for(auto& inner : list(c, a[0])){
        auto& items = list(c, inner);
        out.insert(out.end(), items.begin(), items.end());
    }
    return checked_list(std::move(out));
}

// intersperse separator list
Value intersperse_fn(const CallContext& c, const Args& a){
    auto& items = list(c, a[1]);
    std::vector<Value> out;
    for(std::size_t i = 0; i < items.size(); ++i){
        if(i) out.push_back(a[0]);
        out.push_back(items[i]);
    }
    return checked_list(std::move(out));
}

} // namespace

void register_list(Table& t){
    add(t, "..", range_fn, 2);   add(t, "range", range_fn, 2);
    add(t, "..=", rangei_fn, 2); add(t, "rangei", rangei_fn, 2);
    add(t, "concat", concat_fn, 2);
    add(t, "prepend", prepend_fn, 2);
    add(t, "append", append_fn, 2);
    add(t, "nth", nth_fn, 2);
    add(t, "set", set_fn, 3);
    add(t, "length", length_fn, 1);
    add(t, "is_empty", is_empty_fn, 1);
    add(t, "head", head_fn, 1);
    add(t, "tail", tail_fn, 1);
    add(t, "init", init_fn, 1);
    add(t, "last", last_fn, 1);
    add(t, "contains", contains_fn, 2);
    add(t, "index_of", index_of_fn, 2);
    add(t, "take", take_fn, 2);
    add(t, "drop", drop_fn, 2);
    add(t, "slice", slice_fn, 3);
    add(t, "reverse", reverse_fn, 1);
    add(t, "sum", sum_fn, 1);
    add(t, "product", product_fn, 1);
    add(t, "min_of", min_of_fn, 1);
    add(t, "max_of", max_of_fn, 1);
    add(t, "sort", sort_fn, 1);
    add(t, "unique", unique_fn, 1);
    add(t, "flatten", flatten_fn, 1);
    add(t, "intersperse", intersperse_fn, 2);
}

} // namespace xylo::builtins
