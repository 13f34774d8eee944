#pragma once
#include "xylo/error.hpp"

// True when f throws xylo::error of the given kind.
template<typename F>
static bool throws_kind(xylo::ErrorKind kind, F&& f){
    try { f(); }
    catch (const xylo::error& e){ return e.kind == kind; }
    return false;
}
