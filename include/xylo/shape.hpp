// Shape graph: basic primitives, composites and collections
#pragma once
#include "xylo/block.hpp"
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace xylo {

// Affine transform, point mapping x' = sx*x + kx*y + tx, y' = ky*x + sy*y + ty.
struct Transform {
    float sx=1, kx=0, ky=0, sy=1, tx=0, ty=0;

    static Transform translate(float tx, float ty){ return Transform{1,0,0,1,tx,ty}; }
    static Transform scale(float sx, float sy){ return Transform{sx,0,0,sy,0,0}; }
    static Transform skew(float kx, float ky){ return Transform{1,kx,ky,1,0,0}; }
    static Transform rotate(float degrees);

    // other applied after this
    Transform post_concat(const Transform& other) const;
    Transform post_translate(float x, float y) const { return post_concat(translate(x,y)); }
    Transform post_scale(float x, float y) const { return post_concat(scale(x,y)); }
    Transform post_rotate(float degrees) const { return post_concat(rotate(degrees)); }
    Transform post_rotate_at(float degrees, float x, float y) const;
    std::array<float,2> map_point(float x, float y) const { return {sx*x + kx*y + tx, ky*x + sy*y + ty}; }
    bool is_identity() const { return sx==1 && kx==0 && ky==0 && sy==1 && tx==0 && ty==0; }
};

bool operator==(const Transform& a, const Transform& b);

struct Hsla { float h=360, s=1, l=1, a=1; };
bool operator==(const Hsla& a, const Hsla& b);

Hsla hsl_from_rgb(std::uint8_t r, std::uint8_t g, std::uint8_t b);

struct HslaChange {
    std::optional<float> h, s, l, a;
};
bool operator==(const HslaChange& x, const HslaChange& y);

struct BasicShape {
    ShapeKind kind = ShapeKind::Square;
    // square: x, y, w, h; circle: x, y, r; triangle: 3 points
    std::array<float,6> geometry{};
    Transform transform;
    Hsla color;
    std::optional<float> zindex;
};

struct Shape;
using ShapePtr = std::shared_ptr<const Shape>;

struct Composite { ShapePtr a, b; };
struct Collection { std::vector<ShapePtr> shapes; };

// Nodes are immutable once shared; setters return a modified copy of the
// top node and keep children shared.
struct Shape {
    std::variant<BasicShape, Composite, Collection> data;
    Transform transform;     // composites and collections only
    HslaChange overwrite;    // applied to every child leaf, innermost wins
    HslaChange shift;        // summed along the path
    std::optional<float> zindex_overwrite;
    std::optional<float> zindex_shift;

    static ShapePtr basic(ShapeKind kind);
    static ShapePtr composite(ShapePtr a, ShapePtr b);
    static ShapePtr collection(std::vector<ShapePtr> shapes);

    bool is_basic() const { return std::holds_alternative<BasicShape>(data); }
};

bool operator==(const Shape& a, const Shape& b);
inline bool operator!=(const Shape& a, const Shape& b){ return !(a==b); }
bool shapes_equal(const ShapePtr& a, const ShapePtr& b);

// Transform setters (fill and empty ignore transforms).
ShapePtr translate(const ShapePtr& s, float tx, float ty);
ShapePtr rotate(const ShapePtr& s, float degrees);
ShapePtr rotate_at(const ShapePtr& s, float degrees, float x, float y);
ShapePtr scale(const ShapePtr& s, float sx, float sy);
ShapePtr skew(const ShapePtr& s, float kx, float ky);
ShapePtr flip(const ShapePtr& s, float degrees);
ShapePtr flip_h(const ShapePtr& s);
ShapePtr flip_v(const ShapePtr& s);
ShapePtr flip_d(const ShapePtr& s);

// Color setters; on composites these record an overwrite and reset shifts.
ShapePtr set_hsla(const ShapePtr& s, std::optional<float> h, std::optional<float> sat, std::optional<float> l, std::optional<float> a);
ShapePtr shift_hsla(const ShapePtr& s, float dh, float ds, float dl, float da);
ShapePtr set_hex(const ShapePtr& s, std::uint8_t r, std::uint8_t g, std::uint8_t b);

// Paint order; same rules as colors (innermost overwrite wins, shifts add up).
ShapePtr set_zindex(const ShapePtr& s, float z);
ShapePtr shift_zindex(const ShapePtr& s, float dz);

// A leaf with its absolute transform and final color.
struct RenderItem {
    ShapeKind kind;
    std::array<float,6> geometry;
    Transform transform;
    Hsla color;
    float zindex = 0;
};

// Resolve a shape graph into leaves in paint order: ascending zindex,
// ties kept in graph order.
std::vector<RenderItem> flatten(const Shape& shape);

// Same, with transforms mapped to canvas pixels: y points down and the
// origin sits at the canvas center. Fills keep the identity transform.
std::vector<RenderItem> flatten(const Shape& shape, std::uint32_t width, std::uint32_t height);

// Node count of the graph, shared children counted once per reference.
std::size_t shape_size(const Shape& shape);

std::string to_string(const Shape& shape, int indent = 0);

} // namespace xylo
