// Flattened instruction blocks produced by the parser
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace xylo {

enum class ShapeKind { Square, Circle, Triangle, Fill, Empty };

struct HexColor { std::uint8_t r=0, g=0, b=0; };

struct Literal;
struct LiteralList { std::vector<Literal> items; };

using literal_data = std::variant<std::int32_t, float, bool, HexColor, ShapeKind, LiteralList>;

struct Literal {
    literal_data data;
};

enum class BinaryOperator {
    Addition, Subtraction, Multiplication, Division, Modulo, Exponentiation,
    Equal, NotEqual, LessThan, LessThanOrEqual, GreaterThan, GreaterThanOrEqual,
    And, Or, Range, RangeInclusive, Composition
};

// Operator symbol; doubles as the name of the builtin implementing it.
const char* symbol(BinaryOperator op);
int precedence(BinaryOperator op);
constexpr int max_precedence = 255;

struct PatternWildcard {};
struct PatternMatches { std::vector<Literal> literals; };
using Pattern = std::variant<PatternMatches, PatternWildcard>;

struct Token;
using Block = std::vector<Token>;

struct Definition {
    std::string name;
    float weight = 1.0f;
    std::vector<std::string> params;
    Block block;
};

using Tree = std::vector<Definition>;

// Every skip is the distance from the token holding it to the first token
// past the sub-block it covers. Match arms are the exception: an arm skip is
// the arm length including the Jump that closes it.
struct CallToken { std::string name; std::size_t argc = 0; };
struct LetToken { std::vector<Definition> defs; std::size_t skip = 0; };
struct IfToken { std::size_t skip = 0; };
struct JumpToken { std::size_t skip = 0; };
struct MatchArm { Pattern pattern; std::size_t skip = 0; };
struct MatchToken { std::vector<MatchArm> arms; };
struct ForToken { std::string var; std::size_t skip = 0; };
struct LoopToken { std::size_t skip = 0; };

using token_data = std::variant<Literal, BinaryOperator, CallToken, LetToken, IfToken, JumpToken, MatchToken, ForToken, LoopToken>;

struct Token {
    token_data data;
};

bool operator==(const Literal& a, const Literal& b);
bool operator==(const Definition& a, const Definition& b);
bool operator==(const Token& a, const Token& b);
inline bool operator!=(const Literal& a, const Literal& b){ return !(a==b); }
inline bool operator!=(const Token& a, const Token& b){ return !(a==b); }

// Literal in source syntax (floats always keep a decimal point).
std::string to_string(const Literal& lit);
std::string to_string(BinaryOperator op);
std::string format_float(float f);
const char* shape_keyword(ShapeKind k);

// Debug dump of a block, one token per line.
std::string dump(const Block& block, int indent = 0);

} // namespace xylo
