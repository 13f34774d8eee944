#pragma once
#include <tao/pegtl.hpp>

namespace xylo::grammar {
using namespace tao::pegtl;

// Identifiers and keywords
struct ident_first : sor< alpha, one<'_'> > {};
struct ident_other : sor< alnum, one<'_'> > {};
struct word_end : not_at< ident_other > {};

template<typename Word>
struct keyword : seq< Word, word_end > {};

struct kw_let : keyword< TAO_PEGTL_STRING("let") > {};
struct kw_if : keyword< TAO_PEGTL_STRING("if") > {};
struct kw_else : keyword< TAO_PEGTL_STRING("else") > {};
struct kw_match : keyword< TAO_PEGTL_STRING("match") > {};
struct kw_for : keyword< TAO_PEGTL_STRING("for") > {};
struct kw_in : keyword< TAO_PEGTL_STRING("in") > {};
struct kw_loop : keyword< TAO_PEGTL_STRING("loop") > {};
struct reserved : sor< kw_let, kw_if, kw_else, kw_match, kw_for, kw_loop > {};

struct identifier : seq< not_at< reserved >, ident_first, star< ident_other > > {};

// Literals
struct sign : one< '+', '-' > {};
struct integer : seq< opt< sign >, plus< digit > > {};
struct floating : seq< opt< sign >, star< digit >, one< '.' >, plus< digit > > {};
struct boolean : sor< keyword< TAO_PEGTL_STRING("true") >, keyword< TAO_PEGTL_STRING("false") > > {};
struct hex_long : seq< rep< 6, xdigit >, not_at< xdigit > > {};
struct hex_short : seq< rep< 3, xdigit >, not_at< xdigit > > {};
struct hex_color : seq< one< '#' >, sor< hex_long, hex_short > > {};

struct shape_square : keyword< TAO_PEGTL_STRING("SQUARE") > {};
struct shape_circle : keyword< TAO_PEGTL_STRING("CIRCLE") > {};
struct shape_triangle : keyword< TAO_PEGTL_STRING("TRIANGLE") > {};
struct shape_fill : keyword< TAO_PEGTL_STRING("FILL") > {};
struct shape_empty : keyword< TAO_PEGTL_STRING("EMPTY") > {};
struct shape_name : sor< shape_square, shape_circle, shape_triangle, shape_fill, shape_empty > {};

// Scalar literal; lists are assembled by the block parser.
struct scalar : sor< hex_color, floating, integer, boolean, shape_name > {};

// Binary operators, longest spelling first
struct op_pow : two< '*' > {};
struct op_mul : one< '*' > {};
struct op_div : one< '/' > {};
struct op_mod : one< '%' > {};
struct op_add : one< '+' > {};
struct op_sub : seq< one< '-' >, not_at< one< '>' > > > {};
struct op_eq : two< '=' > {};
struct op_neq : string< '!', '=' > {};
struct op_lte : string< '<', '=' > {};
struct op_lt : one< '<' > {};
struct op_gte : string< '>', '=' > {};
struct op_gt : one< '>' > {};
struct op_and : two< '&' > {};
struct op_or : two< '|' > {};
struct op_range_inclusive : string< '.', '.', '=' > {};
struct op_range : two< '.' > {};
struct op_compose : one< ':' > {};
struct binary_operator : sor< op_pow, op_mul, op_div, op_mod, op_add, op_sub, op_eq, op_neq, op_lte, op_lt,
                              op_gte, op_gt, op_and, op_or, op_range_inclusive, op_range, op_compose > {};

// Operator named as a function: (+)
struct operator_name : seq< one< '(' >, binary_operator, one< ')' > > {};

// Punctuation
struct arrow : string< '-', '>' > {};
struct blank : one< ' ', '\t' > {};
struct newline : sor< string< '\r', '\n' >, one< '\n' > > {};

} // namespace xylo::grammar
