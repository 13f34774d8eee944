#pragma once
#include "grammar.hpp"
#include "xylo/block.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

namespace xylo::actions {

namespace pg = tao::pegtl;

struct literal_state {
    Literal value;
};

struct operator_state {
    BinaryOperator op = BinaryOperator::Addition;
};

template<typename Rule> struct literal_action : pg::nothing<Rule> {};

inline int hex_nibble(char c){
    if(c>='0' && c<='9') return c-'0';
    if(c>='a' && c<='f') return c-'a'+10;
    return c-'A'+10;
}

template<> struct literal_action<grammar::integer> {
    // Out-of-range integers fail the rule instead of wrapping.
    template<typename Input> static bool apply(const Input& in, literal_state& st){
        std::string text = in.string();
        errno = 0;
        long long v = std::strtoll(text.c_str(), nullptr, 10);
        if(errno == ERANGE || v < std::numeric_limits<std::int32_t>::min() || v > std::numeric_limits<std::int32_t>::max()) return false;
        st.value.data = static_cast<std::int32_t>(v);
        return true;
    }
};
template<> struct literal_action<grammar::floating> {
    template<typename Input> static void apply(const Input& in, literal_state& st){ st.value.data = std::strtof(in.string().c_str(), nullptr); }
};
template<> struct literal_action<grammar::boolean> {
    template<typename Input> static void apply(const Input& in, literal_state& st){ st.value.data = (in.string() == "true"); }
};
template<> struct literal_action<grammar::hex_long> {
    template<typename Input> static void apply(const Input& in, literal_state& st){
        std::string s = in.string(); HexColor c;
        c.r = static_cast<std::uint8_t>(hex_nibble(s[0])*16 + hex_nibble(s[1]));
        c.g = static_cast<std::uint8_t>(hex_nibble(s[2])*16 + hex_nibble(s[3]));
        c.b = static_cast<std::uint8_t>(hex_nibble(s[4])*16 + hex_nibble(s[5]));
        st.value.data = c;
    }
};
template<> struct literal_action<grammar::hex_short> {
    template<typename Input> static void apply(const Input& in, literal_state& st){
        std::string s = in.string(); HexColor c;
        c.r = static_cast<std::uint8_t>(hex_nibble(s[0])*17);
        c.g = static_cast<std::uint8_t>(hex_nibble(s[1])*17);
        c.b = static_cast<std::uint8_t>(hex_nibble(s[2])*17);
        st.value.data = c;
    }
};
template<> struct literal_action<grammar::shape_square> { static void apply0(literal_state& st){ st.value.data = ShapeKind::Square; } };
template<> struct literal_action<grammar::shape_circle> { static void apply0(literal_state& st){ st.value.data = ShapeKind::Circle; } };
template<> struct literal_action<grammar::shape_triangle> { static void apply0(literal_state& st){ st.value.data = ShapeKind::Triangle; } };
template<> struct literal_action<grammar::shape_fill> { static void apply0(literal_state& st){ st.value.data = ShapeKind::Fill; } };
template<> struct literal_action<grammar::shape_empty> { static void apply0(literal_state& st){ st.value.data = ShapeKind::Empty; } };

template<typename Rule> struct operator_action : pg::nothing<Rule> {};

template<BinaryOperator Op>
struct set_operator { static void apply0(operator_state& st){ st.op = Op; } };

template<> struct operator_action<grammar::op_pow> : set_operator<BinaryOperator::Exponentiation> {};
template<> struct operator_action<grammar::op_mul> : set_operator<BinaryOperator::Multiplication> {};
template<> struct operator_action<grammar::op_div> : set_operator<BinaryOperator::Division> {};
template<> struct operator_action<grammar::op_mod> : set_operator<BinaryOperator::Modulo> {};
template<> struct operator_action<grammar::op_add> : set_operator<BinaryOperator::Addition> {};
template<> struct operator_action<grammar::op_sub> : set_operator<BinaryOperator::Subtraction> {};
template<> struct operator_action<grammar::op_eq> : set_operator<BinaryOperator::Equal> {};
template<> struct operator_action<grammar::op_neq> : set_operator<BinaryOperator::NotEqual> {};
template<> struct operator_action<grammar::op_lte> : set_operator<BinaryOperator::LessThanOrEqual> {};
template<> struct operator_action<grammar::op_lt> : set_operator<BinaryOperator::LessThan> {};
template<> struct operator_action<grammar::op_gte> : set_operator<BinaryOperator::GreaterThanOrEqual> {};
template<> struct operator_action<grammar::op_gt> : set_operator<BinaryOperator::GreaterThan> {};
template<> struct operator_action<grammar::op_and> : set_operator<BinaryOperator::And> {};
template<> struct operator_action<grammar::op_or> : set_operator<BinaryOperator::Or> {};
template<> struct operator_action<grammar::op_range_inclusive> : set_operator<BinaryOperator::RangeInclusive> {};
template<> struct operator_action<grammar::op_range> : set_operator<BinaryOperator::Range> {};
template<> struct operator_action<grammar::op_compose> : set_operator<BinaryOperator::Composition> {};

} // namespace xylo::actions
