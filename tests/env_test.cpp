#include <cassert>
#include <iostream>
#include "xylo/env.hpp"
#include "xylo/interpreter.hpp"
#include "test_env.hpp"

using namespace xylo;

static void clear_env(){
    _putenv("XYLO_MAX_DEPTH=");
    _putenv("XYLO_THREADS=");
    _putenv("XYLO_NO_CACHE=");
    _putenv("XYLO_TRACE=");
    _putenv("XYLO_WIDTH=");
    _putenv("XYLO_HEIGHT=");
}

void run_env_tests(){
    clear_env();
    {
        auto e = detect_env();
        assert(!e.maxDepth && !e.threads && !e.width && !e.height);
        assert(!e.noCache && !e.trace);
        auto o = ReduceOptions::from_env();
        assert(o.maxDepth == 1500 && o.cache && !o.trace && o.width == 400 && o.height == 400);
    }
    _putenv("XYLO_MAX_DEPTH=50");
    _putenv("XYLO_THREADS=2");
    _putenv("XYLO_NO_CACHE=1");
    _putenv("XYLO_TRACE=0");
    _putenv("XYLO_WIDTH=abc");
    _putenv("XYLO_HEIGHT=300");
    {
        auto e = detect_env();
        assert(e.maxDepth && *e.maxDepth == 50);
        assert(e.threads && *e.threads == 2);
        assert(e.noCache && !e.trace);
        assert(!e.width);
        assert(e.height && *e.height == 300);
        auto o = ReduceOptions::from_env();
        assert(o.maxDepth == 50 && o.threads == 2 && !o.cache);
        assert(o.width == 400 && o.height == 300);
    }
    _putenv("XYLO_TRACE=yes");
    _putenv("XYLO_MAX_DEPTH=-4");
    assert(env_flag_enabled("XYLO_TRACE"));
    assert(!detect_env().maxDepth);
    clear_env();
    std::cout << "Env tests passed\n";
}
