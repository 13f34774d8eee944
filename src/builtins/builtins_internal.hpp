// Shared helpers for the builtin implementation files
#pragma once
#include "xylo/builtins.hpp"
#include "xylo/error.hpp"
#include <string>
#include <unordered_map>

namespace xylo::builtins {

using Args = std::vector<Value>;
using Table = std::unordered_map<std::string_view, Builtin>;

[[noreturn]] inline void bad_argument(const CallContext& c){ throw invalid_argument(std::string(c.name)); }

inline float num(const CallContext& c, const Value& v){
    if(v.is_integer()) return static_cast<float>(v.as_integer());
    if(v.is_float()) return v.as_float();
    bad_argument(c);
}

inline std::int32_t integer(const CallContext& c, const Value& v){
    if(!v.is_integer()) bad_argument(c);
    return v.as_integer();
}

inline bool boolean(const CallContext& c, const Value& v){
    if(!v.is_boolean()) bad_argument(c);
    return v.as_boolean();
}

inline const ShapePtr& shape(const CallContext& c, const Value& v){
    if(!v.is_shape()) bad_argument(c);
    return v.as_shape();
}

inline const std::vector<Value>& list(const CallContext& c, const Value& v){
    if(!v.is_list()) bad_argument(c);
    return v.as_list();
}

inline void add(Table& t, std::string_view name, BuiltinFn fn, std::size_t arity, bool pure = true){
    t.emplace(name, Builtin{fn, arity, pure});
}

void register_math(Table& t);
void register_compare(Table& t);
void register_list(Table& t);
void register_random(Table& t);
void register_shape(Table& t);
void register_transform(Table& t);
void register_color(Table& t);
void register_system(Table& t);

} // namespace xylo::builtins
