// Reducer: evaluates a parsed tree down to a shape
#pragma once
#include "xylo/block.hpp"
#include "xylo/cache.hpp"
#include "xylo/shape.hpp"
#include "xylo/task_pool.hpp"
#include "xylo/value.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace xylo {

struct ReduceOptions {
    std::optional<Seed> seed;
    std::size_t maxDepth = 1500;
    unsigned threads = 0;            // 0 = hardware concurrency, 1 = sequential
    std::uint32_t width = 400;
    std::uint32_t height = 400;
    bool cache = true;
    bool trace = false;              // one stderr line per call

    // Defaults overridden by the XYLO_* variables (see env.hpp).
    static ReduceOptions from_env();
};

struct ReduceStats {
    std::uint64_t calls = 0;
    std::uint64_t bodyEvaluations = 0;
    std::uint64_t cacheHits = 0;
    std::uint64_t cacheMisses = 0;
};

class Interpreter {
public:
    explicit Interpreter(ReduceOptions options = {});

    // Evaluates `root`; throws error(InvalidRoot) unless it yields a shape.
    ShapePtr reduce(const Tree& tree);

    // Evaluates any zero-argument function.
    Value run(const Tree& tree, const std::string& entry = "root");

    // Counters of the most recent run.
    ReduceStats stats() const;

    const ReduceOptions& options() const { return options_; }

private:
    friend class Evaluation;
    struct Counters {
        std::atomic<std::uint64_t> calls{0}, bodies{0}, hits{0}, misses{0};
    };

    ReduceOptions options_;
    TaskPool pool_;
    Counters counters_;
};

// Convenience wrapper: one sequential-or-parallel reduction with defaults.
ShapePtr reduce(const Tree& tree, std::optional<Seed> seed);

} // namespace xylo
