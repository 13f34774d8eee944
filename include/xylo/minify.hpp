// Compact re-parseable printing of scripts
#pragma once
#include "xylo/block.hpp"
#include <string>
#include <string_view>

namespace xylo {

// One expression, fully parenthesised.
std::string minify(const Block& block);

// `name[@weight] params=body`, one definition per line.
std::string minify(const Tree& tree);

// Parse then print; throws parse_error like parse().
std::string minify(std::string_view source);

} // namespace xylo
