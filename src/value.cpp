#include "xylo/value.hpp"
#include "xylo/error.hpp"
#include <type_traits>

namespace xylo {

bool operator==(const ValueKind& a, const ValueKind& b){
    if(a.tag != b.tag) return false;
    if(a.tag != ValueKind::Tag::List) return true;
    if(!a.element || !b.element) return a.element == b.element;
    return *a.element == *b.element;
}

// Unknown (empty list element) unifies with anything.
static bool unify(ValueKind& acc, const ValueKind& next){
    if(acc.tag == ValueKind::Tag::Unknown){ acc = next; return true; }
    if(next.tag == ValueKind::Tag::Unknown) return true;
    if(acc.tag != next.tag) return false;
    if(acc.tag != ValueKind::Tag::List) return true;
    ValueKind inner = *acc.element;
    if(!unify(inner, *next.element)) return false;
    acc.element = std::make_shared<const ValueKind>(inner);
    return true;
}

ValueKind kind(const Value& v){
    return std::visit([](const auto& x)->ValueKind{
        using T = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<T,std::int32_t>) return ValueKind{ValueKind::Tag::Integer, nullptr};
        else if constexpr(std::is_same_v<T,float>) return ValueKind{ValueKind::Tag::Float, nullptr};
        else if constexpr(std::is_same_v<T,bool>) return ValueKind{ValueKind::Tag::Boolean, nullptr};
        else if constexpr(std::is_same_v<T,ShapePtr>) return ValueKind{ValueKind::Tag::Shape, nullptr};
        else {
            ValueKind elem;
            for(auto& item : x.items){
                if(!unify(elem, kind(item))) throw make_error(ErrorKind::InvalidList);
            }
            return ValueKind{ValueKind::Tag::List, std::make_shared<const ValueKind>(elem)};
        }
    }, v.data);
}

std::string to_string(const ValueKind& k){
    switch(k.tag){
        case ValueKind::Tag::Integer: return "Integer";
        case ValueKind::Tag::Float: return "Float";
        case ValueKind::Tag::Boolean: return "Boolean";
        case ValueKind::Tag::Shape: return "Shape";
        case ValueKind::Tag::List: return "List(" + (k.element ? to_string(*k.element) : std::string("Unknown")) + ")";
        case ValueKind::Tag::Unknown: return "Unknown";
    }
    return "Unknown";
}

Value checked_list(std::vector<Value> items){
    Value v = Value::list(std::move(items));
    (void)kind(v);
    return v;
}

bool operator==(const Value& a, const Value& b){
    if(a.data.index()!=b.data.index()) return false;
    return std::visit([&](const auto& x)->bool{
        using T = std::decay_t<decltype(x)>;
        const auto& y = std::get<T>(b.data);
        if constexpr(std::is_same_v<T,ShapePtr>) return shapes_equal(x, y);
        else if constexpr(std::is_same_v<T,ValueList>) return x.items == y.items;
        else return x == y;
    }, a.data);
}

Value from_literal(const Literal& lit){
    return std::visit([](const auto& x)->Value{
        using T = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<T,HexColor>) return Value(static_cast<std::int32_t>((x.r<<16) | (x.g<<8) | x.b));
        else if constexpr(std::is_same_v<T,ShapeKind>) return Value(Shape::basic(x));
        else if constexpr(std::is_same_v<T,LiteralList>){
            std::vector<Value> items;
            items.reserve(x.items.size());
            for(auto& item : x.items) items.push_back(from_literal(item));
            return checked_list(std::move(items));
        }
        else return Value(x);
    }, lit.data);
}

std::string to_string(const Value& v){
    return std::visit([](const auto& x)->std::string{
        using T = std::decay_t<decltype(x)>;
        if constexpr(std::is_same_v<T,std::int32_t>) return std::to_string(x);
        else if constexpr(std::is_same_v<T,float>) return format_float(x);
        else if constexpr(std::is_same_v<T,bool>) return x ? "true" : "false";
        else if constexpr(std::is_same_v<T,ShapePtr>) return to_string(*x);
        else {
            std::string out = "[";
            for(size_t i=0;i<x.items.size();++i){ if(i) out += ", "; out += to_string(x.items[i]); }
            return out + "]";
        }
    }, v.data);
}

} // namespace xylo
