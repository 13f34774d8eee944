#include "builtins_internal.hpp"

namespace xylo::builtins {

namespace {

Value width_fn(const CallContext& c, const Args&){ return Value(static_cast<std::int32_t>(c.width)); }
Value height_fn(const CallContext& c, const Args&){ return Value(static_cast<std::int32_t>(c.height)); }

} // namespace

void register_system(Table& t){
    add(t, "width", width_fn, 0);
    add(t, "height", height_fn, 0);
}

} // namespace xylo::builtins
