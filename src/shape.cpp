#include "xylo/shape.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace xylo {

static constexpr float kPi = 3.14159265358979323846f;

static Transform concat(const Transform& a, const Transform& b){
    Transform r;
    r.sx = a.sx*b.sx + a.kx*b.ky;
    r.kx = a.sx*b.kx + a.kx*b.sy;
    r.tx = a.sx*b.tx + a.kx*b.ty + a.tx;
    r.ky = a.ky*b.sx + a.sy*b.ky;
    r.sy = a.ky*b.kx + a.sy*b.sy;
    r.ty = a.ky*b.tx + a.sy*b.ty + a.ty;
    return r;
}

Transform Transform::rotate(float degrees){
    float rad = degrees * kPi / 180.0f;
    float c = std::cos(rad), s = std::sin(rad);
    return Transform{c, -s, s, c, 0, 0};
}

Transform Transform::post_concat(const Transform& other) const { return concat(other, *this); }

Transform Transform::post_rotate_at(float degrees, float x, float y) const {
    Transform about = concat(concat(translate(x,y), rotate(degrees)), translate(-x,-y));
    return post_concat(about);
}

bool operator==(const Transform& a, const Transform& b){
    return a.sx==b.sx && a.kx==b.kx && a.ky==b.ky && a.sy==b.sy && a.tx==b.tx && a.ty==b.ty;
}

bool operator==(const Hsla& a, const Hsla& b){ return a.h==b.h && a.s==b.s && a.l==b.l && a.a==b.a; }
bool operator==(const HslaChange& x, const HslaChange& y){ return x.h==y.h && x.s==y.s && x.l==y.l && x.a==y.a; }

Hsla hsl_from_rgb(std::uint8_t r8, std::uint8_t g8, std::uint8_t b8){
    float r = r8/255.0f, g = g8/255.0f, b = b8/255.0f;
    float mx = std::max({r,g,b}), mn = std::min({r,g,b});
    float l = (mx+mn)/2.0f;
    Hsla out{0, 0, l, 1};
    float d = mx - mn;
    if(d == 0.0f) return out;
    out.s = l > 0.5f ? d/(2.0f-mx-mn) : d/(mx+mn);
    float h;
    if(mx == r) h = (g-b)/d + (g < b ? 6.0f : 0.0f);
    else if(mx == g) h = (b-r)/d + 2.0f;
    else h = (r-g)/d + 4.0f;
    out.h = h * 60.0f;
    return out;
}

ShapePtr Shape::basic(ShapeKind kind){
    if(kind == ShapeKind::Empty) return collection({});
    BasicShape b; b.kind = kind;
    switch(kind){
        case ShapeKind::Square: b.geometry = {-1.0f, -1.0f, 2.0f, 2.0f, 0, 0}; break;
        case ShapeKind::Circle: b.geometry = {0.0f, 0.0f, 1.0f, 0, 0, 0}; break;
        case ShapeKind::Triangle: b.geometry = {-1.0f, 0.577350269f, 1.0f, 0.577350269f, 0.0f, -1.154700538f}; break;
        default: break;
    }
    auto s = std::make_shared<Shape>(); s->data = b; return s;
}

ShapePtr Shape::composite(ShapePtr a, ShapePtr b){
    auto s = std::make_shared<Shape>(); s->data = Composite{std::move(a), std::move(b)}; return s;
}

ShapePtr Shape::collection(std::vector<ShapePtr> shapes){
    auto s = std::make_shared<Shape>(); s->data = Collection{std::move(shapes)}; return s;
}

bool shapes_equal(const ShapePtr& a, const ShapePtr& b){
    if(a == b) return true;
    if(!a || !b) return false;
    return *a == *b;
}

bool operator==(const Shape& a, const Shape& b){
    if(a.data.index()!=b.data.index()) return false;
    if(!(a.transform==b.transform) || !(a.overwrite==b.overwrite) || !(a.shift==b.shift)) return false;
    if(a.zindex_overwrite!=b.zindex_overwrite || a.zindex_shift!=b.zindex_shift) return false;
    if(auto* x = std::get_if<BasicShape>(&a.data)){
        const auto& y = std::get<BasicShape>(b.data);
        return x->kind==y.kind && x->geometry==y.geometry && x->transform==y.transform && x->color==y.color && x->zindex==y.zindex;
    }
    if(auto* x = std::get_if<Composite>(&a.data)){
        const auto& y = std::get<Composite>(b.data);
        return shapes_equal(x->a, y.a) && shapes_equal(x->b, y.b);
    }
    const auto& x = std::get<Collection>(a.data).shapes;
    const auto& y = std::get<Collection>(b.data).shapes;
    if(x.size()!=y.size()) return false;
    for(size_t i=0;i<x.size();++i) if(!shapes_equal(x[i], y[i])) return false;
    return true;
}

template<typename F>
static ShapePtr with_transform(const ShapePtr& s, F&& f){
    auto out = std::make_shared<Shape>(*s);
    if(auto* b = std::get_if<BasicShape>(&out->data)){
        if(b->kind == ShapeKind::Fill) return s;
        b->transform = f(b->transform);
    } else {
        out->transform = f(out->transform);
    }
    return out;
}

ShapePtr translate(const ShapePtr& s, float tx, float ty){ return with_transform(s, [&](const Transform& t){ return t.post_translate(tx,ty); }); }
ShapePtr rotate(const ShapePtr& s, float degrees){ return with_transform(s, [&](const Transform& t){ return t.post_rotate(degrees); }); }
ShapePtr rotate_at(const ShapePtr& s, float degrees, float x, float y){ return with_transform(s, [&](const Transform& t){ return t.post_rotate_at(degrees,x,y); }); }
ShapePtr scale(const ShapePtr& s, float sx, float sy){ return with_transform(s, [&](const Transform& t){ return t.post_scale(sx,sy); }); }
ShapePtr skew(const ShapePtr& s, float kx, float ky){ return with_transform(s, [&](const Transform& t){ return t.post_concat(Transform::skew(kx,ky)); }); }
ShapePtr flip(const ShapePtr& s, float degrees){ return with_transform(s, [&](const Transform& t){ return t.post_rotate(degrees).post_scale(-1,1).post_rotate(-degrees); }); }
ShapePtr flip_h(const ShapePtr& s){ return scale(s, -1, 1); }
ShapePtr flip_v(const ShapePtr& s){ return scale(s, 1, -1); }
ShapePtr flip_d(const ShapePtr& s){ return scale(s, -1, -1); }

ShapePtr set_hsla(const ShapePtr& s, std::optional<float> h, std::optional<float> sat, std::optional<float> l, std::optional<float> a){
    auto out = std::make_shared<Shape>(*s);
    if(auto* b = std::get_if<BasicShape>(&out->data)){
        if(h) b->color.h = *h;
        if(sat) b->color.s = *sat;
        if(l) b->color.l = *l;
        if(a) b->color.a = *a;
    } else {
        if(h) out->overwrite.h = h;
        if(sat) out->overwrite.s = sat;
        if(l) out->overwrite.l = l;
        if(a) out->overwrite.a = a;
        out->shift = HslaChange{};
    }
    return out;
}

ShapePtr shift_hsla(const ShapePtr& s, float dh, float ds, float dl, float da){
    auto out = std::make_shared<Shape>(*s);
    if(auto* b = std::get_if<BasicShape>(&out->data)){
        b->color.h += dh; b->color.s += ds; b->color.l += dl; b->color.a += da;
    } else {
        auto bump = [](std::optional<float>& slot, float d){ if(d != 0.0f) slot = slot.value_or(0.0f) + d; };
        bump(out->shift.h, dh); bump(out->shift.s, ds); bump(out->shift.l, dl); bump(out->shift.a, da);
    }
    return out;
}

ShapePtr set_hex(const ShapePtr& s, std::uint8_t r, std::uint8_t g, std::uint8_t b){
    Hsla c = hsl_from_rgb(r,g,b);
    return set_hsla(s, c.h, c.s, c.l, std::nullopt);
}

ShapePtr set_zindex(const ShapePtr& s, float z){
    auto out = std::make_shared<Shape>(*s);
    if(auto* b = std::get_if<BasicShape>(&out->data)){
        b->zindex = z;
    } else {
        out->zindex_overwrite = z;
        out->zindex_shift.reset();
    }
    return out;
}

ShapePtr shift_zindex(const ShapePtr& s, float dz){
    auto out = std::make_shared<Shape>(*s);
    if(auto* b = std::get_if<BasicShape>(&out->data)) b->zindex = b->zindex.value_or(0.0f) + dz;
    else out->zindex_shift = out->zindex_shift.value_or(0.0f) + dz;
    return out;
}

namespace {

struct FlattenState {
    Transform transform;
    HslaChange overwrite;
    HslaChange shift;
    std::optional<float> zindex_overwrite;
    std::optional<float> zindex_shift;
};

void flatten_into(const Shape& shape, const FlattenState& st, std::vector<RenderItem>& out){
    if(auto* b = std::get_if<BasicShape>(&shape.data)){
        RenderItem item{b->kind, b->geometry, b->transform.post_concat(st.transform), b->color, 0.0f};
        item.zindex = st.zindex_overwrite ? *st.zindex_overwrite : b->zindex.value_or(0.0f);
        item.zindex += st.zindex_shift.value_or(0.0f);
        item.color.h = st.overwrite.h.value_or(item.color.h) + st.shift.h.value_or(0.0f);
        item.color.s = st.overwrite.s.value_or(item.color.s) + st.shift.s.value_or(0.0f);
        item.color.l = st.overwrite.l.value_or(item.color.l) + st.shift.l.value_or(0.0f);
        item.color.a = st.overwrite.a.value_or(item.color.a) + st.shift.a.value_or(0.0f);
        out.push_back(item);
        return;
    }
    FlattenState next;
    next.transform = shape.transform.post_concat(st.transform);
    auto pick = [](const std::optional<float>& inner, const std::optional<float>& outer){ return inner ? inner : outer; };
    auto sum = [](const std::optional<float>& x, const std::optional<float>& y)->std::optional<float>{
        if(!x && !y) return std::nullopt;
        return x.value_or(0.0f) + y.value_or(0.0f);
    };
    next.overwrite = HslaChange{pick(shape.overwrite.h, st.overwrite.h), pick(shape.overwrite.s, st.overwrite.s),
                                pick(shape.overwrite.l, st.overwrite.l), pick(shape.overwrite.a, st.overwrite.a)};
    next.shift = HslaChange{sum(shape.shift.h, st.shift.h), sum(shape.shift.s, st.shift.s),
                            sum(shape.shift.l, st.shift.l), sum(shape.shift.a, st.shift.a)};
    next.zindex_overwrite = pick(shape.zindex_overwrite, st.zindex_overwrite);
    next.zindex_shift = sum(shape.zindex_shift, st.zindex_shift);
    if(auto* c = std::get_if<Composite>(&shape.data)){
        flatten_into(*c->a, next, out);
        flatten_into(*c->b, next, out);
        return;
    }
    for(auto& child : std::get<Collection>(shape.data).shapes) flatten_into(*child, next, out);
}

void append_change(std::ostringstream& os, const char* label, const HslaChange& c){
    if(!c.h && !c.s && !c.l && !c.a) return;
    os<<" "<<label<<"(";
    auto part = [&](const char* n, const std::optional<float>& v, bool& first){ if(v){ if(!first) os<<","; os<<n<<"="<<format_float(*v); first=false; } };
    bool first = true;
    part("h", c.h, first); part("s", c.s, first); part("l", c.l, first); part("a", c.a, first);
    os<<")";
}

void append_transform(std::ostringstream& os, const Transform& t){
    if(t.is_identity()) return;
    os<<" transform("<<format_float(t.sx)<<","<<format_float(t.kx)<<","<<format_float(t.ky)<<","
      <<format_float(t.sy)<<","<<format_float(t.tx)<<","<<format_float(t.ty)<<")";
}

} // namespace

std::vector<RenderItem> flatten(const Shape& shape){
    std::vector<RenderItem> out;
    flatten_into(shape, FlattenState{}, out);
    std::stable_sort(out.begin(), out.end(), [](const RenderItem& a, const RenderItem& b){ return a.zindex < b.zindex; });
    return out;
}

std::vector<RenderItem> flatten(const Shape& shape, std::uint32_t width, std::uint32_t height){
    std::vector<RenderItem> out = flatten(shape);
    Transform canvas = Transform::scale(1.0f, -1.0f).post_translate(width / 2.0f, height / 2.0f);
    for(auto& item : out){
        if(item.kind == ShapeKind::Fill) item.transform = Transform{};
        else item.transform = item.transform.post_concat(canvas);
    }
    return out;
}

std::size_t shape_size(const Shape& shape){
    if(auto* c = std::get_if<Composite>(&shape.data)) return 1 + shape_size(*c->a) + shape_size(*c->b);
    if(auto* c = std::get_if<Collection>(&shape.data)){
        std::size_t n = 1;
        for(auto& s : c->shapes) n += shape_size(*s);
        return n;
    }
    return 1;
}

std::string to_string(const Shape& shape, int indent){
    std::ostringstream os;
    std::string pad(static_cast<size_t>(indent)*2, ' ');
    if(auto* b = std::get_if<BasicShape>(&shape.data)){
        os<<pad<<shape_keyword(b->kind);
        append_transform(os, b->transform);
        if(b->zindex) os<<" z="<<format_float(*b->zindex);
        os<<" hsla("<<format_float(b->color.h)<<","<<format_float(b->color.s)<<","<<format_float(b->color.l)<<","<<format_float(b->color.a)<<")\n";
        return os.str();
    }
    bool composite = std::holds_alternative<Composite>(shape.data);
    os<<pad<<(composite ? "composite" : "collection");
    append_transform(os, shape.transform);
    append_change(os, "overwrite", shape.overwrite);
    append_change(os, "shift", shape.shift);
    if(shape.zindex_overwrite) os<<" z="<<format_float(*shape.zindex_overwrite);
    if(shape.zindex_shift) os<<" zshift="<<format_float(*shape.zindex_shift);
    os<<"\n";
    if(auto* c = std::get_if<Composite>(&shape.data)){
        os<<to_string(*c->a, indent+1)<<to_string(*c->b, indent+1);
    } else {
        for(auto& s : std::get<Collection>(shape.data).shapes) os<<to_string(*s, indent+1);
    }
    return os.str();
}

} // namespace xylo
