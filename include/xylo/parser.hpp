// Indentation-sensitive script parser producing flattened blocks
#pragma once
#include "xylo/block.hpp"
#include "xylo/error.hpp"
#include <string>
#include <string_view>

namespace xylo {

struct ParseResult {
    bool success = false;
    Tree tree;
    std::string error_message;
    int line = 0;
    int column = 0;
};

// Parse a whole script; throws parse_error at the farthest failing position.
Tree parse(std::string_view source);

// Non-throwing variant reporting the failure position.
ParseResult try_parse(std::string_view source);

} // namespace xylo
