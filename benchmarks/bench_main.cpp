#include "xylo/xylo.hpp"
#include <chrono>
#include <iostream>
#include <vector>
#include <cstdlib>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; double ms_reduce; size_t leaves; };

static RunResult bench_case(const char* name, const std::string &program, unsigned threads){
    xylo::ReduceOptions options;
    options.seed = xylo::seed_from_string("bench");
    options.threads = threads;
    auto t0 = Clock::now();
    xylo::Tree tree;
    try {
        tree = xylo::parse(program);
    } catch (const xylo::parse_error& e){
        std::cerr << "[bench] case '" << name << "' failed to parse: " << e.what() << "\n";
        return {0.0, 0.0, 0};
    }
    auto t1 = Clock::now();
    size_t leaves = 0;
    try {
        xylo::Interpreter in(options);
        leaves = xylo::flatten(*in.reduce(tree)).size();
    } catch (const xylo::error& e){
        std::cerr << "[bench] case '" << name << "' failed to reduce: " << e.what() << "\n";
        return {0.0, 0.0, 0};
    }
    auto t2 = Clock::now();
    double ms_parse = std::chrono::duration<double, std::milli>(t1 - t0).count();
    double ms_reduce = std::chrono::duration<double, std::milli>(t2 - t1).count();
    return { ms_parse, ms_reduce, leaves };
}

int main(){
    // Deterministic draws unless the caller overrides it
#ifdef _WIN32
    _putenv_s("XYLO_THREADS", getenv("XYLO_THREADS") ? getenv("XYLO_THREADS") : "1");
#else
    setenv("XYLO_THREADS", getenv("XYLO_THREADS") ? getenv("XYLO_THREADS") : "1", 1);
#endif
    unsigned threads = static_cast<unsigned>(std::strtoul(getenv("XYLO_THREADS"), nullptr, 10));

    struct Case { const char* name; std::string prog; };
    std::vector<Case> cases;

    // Case 1: binary recursion, pure so the cache collapses it
    cases.push_back({
        "fib_tree",
        "fib n = if n < 2 -> n; else -> fib (n - 1) + fib (n - 2)\n"
        "root = tx (float (fib 24)) SQUARE\n"
    });

    // Case 2: wide collection built by iteration
    cases.push_back({
        "grid",
        "cell x y = t (float x) (float y) (ss 0.4 SQUARE)\n"
        "root = collect (for p in 0..4096 -> cell (p % 64) (p / 64))\n"
    });

    // Case 3: weighted recursion drawing from the generator
    cases.push_back({
        "weighted_spiral",
        "spiral@3 n = if n > 0 -> r 10 (ss 0.97 (spiral (n - 1))) : SQUARE; else -> EMPTY\n"
        "spiral@1 n = if n > 0 -> hshift 5 (spiral (n - 1)); else -> EMPTY\n"
        "root = spiral 400\n"
    });

    std::cout << "name,ms_parse,ms_reduce,leaves\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.prog, threads);
        std::cout << c.name << "," << r.ms_parse << "," << r.ms_reduce << "," << r.leaves << "\n";
    }
    return 0;
}
