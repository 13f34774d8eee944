// xylo.hpp - public entry points of the script parser and reducer
#pragma once
#include "xylo/block.hpp"
#include "xylo/builtins.hpp"
#include "xylo/cache.hpp"
#include "xylo/diagnostics_json.hpp"
#include "xylo/env.hpp"
#include "xylo/error.hpp"
#include "xylo/interpreter.hpp"
#include "xylo/minify.hpp"
#include "xylo/parser.hpp"
#include "xylo/shape.hpp"
#include "xylo/value.hpp"
