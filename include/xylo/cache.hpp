// Memoization cache keyed by call fingerprints; owns the seeded generator
#pragma once
#include "xylo/value.hpp"
#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xylo {

using Seed = std::array<std::uint8_t, 32>;

// Innermost global body being evaluated: its name and branch.
struct Scope {
    std::string name;
    std::size_t branch = 0;
};

inline bool operator==(const Scope& a, const Scope& b){ return a.name == b.name && a.branch == b.branch; }

// Expand an arbitrary seed string into 32 bytes.
Seed seed_from_string(std::string_view text);

// Deterministic byte encoding of a value; shapes contribute a structural digest.
void serialize_value(const Value& v, std::string& out);

class Cache {
public:
    using Rng = std::mt19937_64;

    // Without a seed the generator draws from std::random_device; throws
    // error(MissingSeed) when no entropy source is available.
    explicit Cache(std::optional<Seed> seed);

    static std::uint64_t hash_call(std::string_view name, std::size_t branch, const std::vector<Value>& args, const std::optional<Scope>& scope);

    std::optional<Value> get(std::uint64_t key) const;
    // Keeps the first value stored under a key.
    void insert(std::uint64_t key, const Value& value);
    std::size_t size() const;

    template<typename F>
    auto with_rng(F&& f){
        std::lock_guard<std::mutex> lk(rng_mutex_);
        return f(rng_);
    }

private:
    static constexpr std::size_t kShards = 16;
    struct Shard {
        mutable std::mutex m;
        std::unordered_map<std::uint64_t, Value> entries;
    };
    Shard& shard(std::uint64_t key){ return shards_[key % kShards]; }
    const Shard& shard(std::uint64_t key) const { return shards_[key % kShards]; }

    std::array<Shard, kShards> shards_;
    std::mutex rng_mutex_;
    Rng rng_;
};

} // namespace xylo
