#include "builtins_internal.hpp"
#include <algorithm>

namespace xylo {

namespace {

const builtins::Table& table(){
    static const builtins::Table t = []{
        builtins::Table t;
        builtins::register_math(t);
        builtins::register_compare(t);
        builtins::register_list(t);
        builtins::register_random(t);
        builtins::register_shape(t);
        builtins::register_transform(t);
        builtins::register_color(t);
        builtins::register_system(t);
        return t;
    }();
    return t;
}

} // namespace

const Builtin* find_builtin(std::string_view name){
    auto& t = table();
    auto it = t.find(name);
    return it == t.end() ? nullptr : &it->second;
}

Value call_builtin(const Builtin& b, const CallContext& ctx, const std::vector<Value>& args){
    if(args.size() != b.arity) throw arity_mismatch(std::string(ctx.name), b.arity, args.size());
    return b.fn(ctx, args);
}

std::vector<std::string_view> builtin_names(){
    std::vector<std::string_view> names;
    for(auto& kv : table()) names.push_back(kv.first);
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace xylo
