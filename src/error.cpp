#include "xylo/error.hpp"

namespace xylo {

const char* error_code(ErrorKind k){
    switch(k){
        case ErrorKind::ParseError: return "X0001";
        case ErrorKind::UnknownFunction: return "X0002";
        case ErrorKind::InvalidArgument: return "X0003";
        case ErrorKind::InvalidDefinition: return "X0004";
        case ErrorKind::InvalidCondition: return "X0005";
        case ErrorKind::InvalidMatch: return "X0006";
        case ErrorKind::MatchNotFound: return "X0007";
        case ErrorKind::NotIterable: return "X0008";
        case ErrorKind::NegativeNumber: return "X0009";
        case ErrorKind::InvalidList: return "X0010";
        case ErrorKind::OutOfBounds: return "X0011";
        case ErrorKind::MaxDepthReached: return "X0012";
        case ErrorKind::MissingSeed: return "X0013";
        case ErrorKind::InvalidRoot: return "X0014";
        case ErrorKind::NotFound: return "X0015";
        case ErrorKind::Io: return "X0016";
    }
    return "X0000";
}

const char* kind_name(ErrorKind k){
    switch(k){
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::UnknownFunction: return "UnknownFunction";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::InvalidDefinition: return "InvalidDefinition";
        case ErrorKind::InvalidCondition: return "InvalidCondition";
        case ErrorKind::InvalidMatch: return "InvalidMatch";
        case ErrorKind::MatchNotFound: return "MatchNotFound";
        case ErrorKind::NotIterable: return "NotIterable";
        case ErrorKind::NegativeNumber: return "NegativeNumber";
        case ErrorKind::InvalidList: return "InvalidList";
        case ErrorKind::OutOfBounds: return "OutOfBounds";
        case ErrorKind::MaxDepthReached: return "MaxDepthReached";
        case ErrorKind::MissingSeed: return "MissingSeed";
        case ErrorKind::InvalidRoot: return "InvalidRoot";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Io: return "Io";
    }
    return "Unknown";
}

error unknown_function(const std::string& name){ return error(ErrorKind::UnknownFunction, "Unknown function `"+name+"`.", name); }
error invalid_argument(const std::string& name){ return error(ErrorKind::InvalidArgument, "Invalid argument passed to `"+name+"` function.", name); }
error invalid_definition(const std::string& name){ return error(ErrorKind::InvalidDefinition, "Incorrect parameters in `"+name+"` function.", name); }

error arity_mismatch(const std::string& name, size_t expected, size_t given){
    return error(ErrorKind::InvalidArgument,
        "Function `"+name+"` takes "+std::to_string(expected)+" argument(s) but "+std::to_string(given)+" were given.", name);
}

error make_error(ErrorKind k){
    switch(k){
        case ErrorKind::ParseError: return error(k, "Could not parse file.");
        case ErrorKind::InvalidCondition: return error(k, "If condition must reduce to a boolean.");
        case ErrorKind::InvalidMatch: return error(k, "Incorrect type comparison in match statement.");
        case ErrorKind::MatchNotFound: return error(k, "Not all possibilities covered in match statement.");
        case ErrorKind::NotIterable: return error(k, "Value is not iterable.");
        case ErrorKind::NegativeNumber: return error(k, "Number must not be negative.");
        case ErrorKind::InvalidList: return error(k, "Type mismatch in list.");
        case ErrorKind::OutOfBounds: return error(k, "Index out of bounds.");
        case ErrorKind::MaxDepthReached: return error(k, "Maximum recursion depth reached.");
        case ErrorKind::MissingSeed: return error(k, "Seed required for rng.");
        case ErrorKind::InvalidRoot: return error(k, "The `root` function must return a shape.");
        case ErrorKind::NotFound: return error(k, "Value not found.");
        default: break;
    }
    return error(k, kind_name(k));
}

} // namespace xylo
