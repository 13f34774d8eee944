#include "builtins_internal.hpp"

namespace xylo::builtins {

namespace {

Value compose_fn(const CallContext& c, const Args& a){
    return Value(Shape::composite(shape(c, a[0]), shape(c, a[1])));
}

Value collect_fn(const CallContext& c, const Args& a){
    std::vector<ShapePtr> shapes;
    for(auto& v : list(c, a[0])) shapes.push_back(shape(c, v));
    return Value(Shape::collection(std::move(shapes)));
}

} // namespace

void register_shape(Table& t){
    add(t, ":", compose_fn, 2);
    add(t, "compose", compose_fn, 2);
    add(t, "collect", collect_fn, 1);
}

} // namespace xylo::builtins
