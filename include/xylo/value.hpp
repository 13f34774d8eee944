// Runtime values produced by the reducer
#pragma once
#include "xylo/shape.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace xylo {

struct Value;
struct ValueList { std::vector<Value> items; };

using value_data = std::variant<std::int32_t, float, bool, ShapePtr, ValueList>;

struct Value {
    value_data data;

    Value() : data(std::int32_t{0}) {}
    Value(std::int32_t v) : data(v) {}
    Value(float v) : data(v) {}
    Value(bool v) : data(v) {}
    Value(ShapePtr v) : data(std::move(v)) {}
    Value(ValueList v) : data(std::move(v)) {}

    bool is_integer() const { return std::holds_alternative<std::int32_t>(data); }
    bool is_float() const { return std::holds_alternative<float>(data); }
    bool is_number() const { return is_integer() || is_float(); }
    bool is_boolean() const { return std::holds_alternative<bool>(data); }
    bool is_shape() const { return std::holds_alternative<ShapePtr>(data); }
    bool is_list() const { return std::holds_alternative<ValueList>(data); }

    std::int32_t as_integer() const { return std::get<std::int32_t>(data); }
    float as_float() const { return std::get<float>(data); }
    bool as_boolean() const { return std::get<bool>(data); }
    const ShapePtr& as_shape() const { return std::get<ShapePtr>(data); }
    const std::vector<Value>& as_list() const { return std::get<ValueList>(data).items; }

    // Integer or Float widened to float; throws std::bad_variant_access otherwise.
    float number() const { return is_integer() ? static_cast<float>(as_integer()) : as_float(); }

    static Value list(std::vector<Value> items){ return Value(ValueList{std::move(items)}); }
};

// Recursive type of a value; Unknown is the element type of an empty list.
struct ValueKind {
    enum class Tag { Integer, Float, Boolean, Shape, List, Unknown };
    Tag tag = Tag::Unknown;
    std::shared_ptr<const ValueKind> element;
};

bool operator==(const ValueKind& a, const ValueKind& b);
inline bool operator!=(const ValueKind& a, const ValueKind& b){ return !(a==b); }

// Kind of v; throws error(InvalidList) when a list mixes element kinds.
ValueKind kind(const Value& v);
std::string to_string(const ValueKind& k);

// Build a list value and validate its homogeneity.
Value checked_list(std::vector<Value> items);

bool operator==(const Value& a, const Value& b);
inline bool operator!=(const Value& a, const Value& b){ return !(a==b); }

// Literal to value; hex colors become packed 0xRRGGBB integers.
Value from_literal(const Literal& lit);

std::string to_string(const Value& v);

} // namespace xylo
