// Error kinds raised by the parser and the reducer
#pragma once
#include <stdexcept>
#include <string>

namespace xylo {

enum class ErrorKind {
    ParseError,
    UnknownFunction,
    InvalidArgument,
    InvalidDefinition,
    InvalidCondition,
    InvalidMatch,
    MatchNotFound,
    NotIterable,
    NegativeNumber,
    InvalidList,
    OutOfBounds,
    MaxDepthReached,
    MissingSeed,
    InvalidRoot,
    NotFound,
    Io
};

// Stable diagnostic code (X0001..) for an error kind.
const char* error_code(ErrorKind k);
const char* kind_name(ErrorKind k);

struct error : std::runtime_error {
    ErrorKind kind;
    std::string name; // offending function, when the kind names one
    error(ErrorKind k, std::string message, std::string fn = {})
        : std::runtime_error(std::move(message)), kind(k), name(std::move(fn)) {}
    const char* code() const { return error_code(kind); }
};

struct parse_error : error {
    int line = -1;
    int col = -1;
    parse_error(std::string message, int l, int c)
        : error(ErrorKind::ParseError, std::move(message)), line(l), col(c) {}
};

// Builders carrying the canonical user-facing messages.
error unknown_function(const std::string& name);
error invalid_argument(const std::string& name);
error invalid_definition(const std::string& name);
error arity_mismatch(const std::string& name, size_t expected, size_t given);
error make_error(ErrorKind k);

} // namespace xylo
