#include <cassert>
#include <iostream>
#include <random>
#include "xylo/cache.hpp"

using namespace xylo;

static void test_hash_call(){
    std::vector<Value> args{Value(std::int32_t{1}), Value(2.0f)};
    auto k = Cache::hash_call("f", 0, args, std::nullopt);
    assert(k == Cache::hash_call("f", 0, args, std::nullopt));
    assert(k != Cache::hash_call("g", 0, args, std::nullopt));
    assert(k != Cache::hash_call("f", 1, args, std::nullopt));
    assert(k != Cache::hash_call("f", 0, {Value(std::int32_t{1}), Value(std::int32_t{2})}, std::nullopt));
    assert(k != Cache::hash_call("f", 0, args, Scope{"root", 0}));
    assert(Cache::hash_call("f", 0, args, Scope{"root", 0}) != Cache::hash_call("f", 0, args, Scope{"root", 1}));

    // structurally equal shapes hash alike, distinct objects or not
    auto a = translate(Shape::basic(ShapeKind::Square), 1, 0);
    auto b = translate(Shape::basic(ShapeKind::Square), 1, 0);
    auto c = translate(Shape::basic(ShapeKind::Square), 0, 1);
    assert(Cache::hash_call("s", 0, {Value(a)}, std::nullopt) == Cache::hash_call("s", 0, {Value(b)}, std::nullopt));
    assert(Cache::hash_call("s", 0, {Value(a)}, std::nullopt) != Cache::hash_call("s", 0, {Value(c)}, std::nullopt));
    assert(Cache::hash_call("s", 0, {Value(a)}, std::nullopt) != Cache::hash_call("s", 0, {Value(set_zindex(a, 1))}, std::nullopt));

    std::string x, y;
    serialize_value(Value::list({Value(true)}), x);
    serialize_value(Value::list({Value(false)}), y);
    assert(!x.empty() && x != y);
}

static void test_first_insert_wins(){
    Cache cache(seed_from_string("cache"));
    assert(!cache.get(7));
    cache.insert(7, Value(std::int32_t{1}));
    cache.insert(7, Value(std::int32_t{2}));
    assert(cache.get(7) && *cache.get(7) == Value(std::int32_t{1}));
    cache.insert(23, Value(true));
    assert(cache.size() == 2);
}

static void test_seeded_rng(){
    assert(seed_from_string("abc") == seed_from_string("abc"));
    assert(seed_from_string("abc") != seed_from_string("abd"));
    // fixed byte hash, identical across standard libraries
    Seed fixed = seed_from_string("xylo");
    assert(fixed[0] == 202 && fixed[1] == 121 && fixed[2] == 98 && fixed[3] == 62);
    assert(fixed[4] == 114 && fixed[5] == 204 && fixed[6] == 250 && fixed[7] == 208);
    assert(seed_from_string("")[0] == 48 && seed_from_string("")[1] == 255);
    Cache a(seed_from_string("spiral")), b(seed_from_string("spiral")), c(seed_from_string("other"));
    auto draw = [](Cache& cache){ return cache.with_rng([](Cache::Rng& rng){ return rng(); }); };
    std::uint64_t x = draw(a);
    assert(x == draw(b));
    assert(draw(a) == draw(b));
    assert(x != draw(c));
    Cache unseeded(std::nullopt);
    (void)draw(unseeded);
}

void run_cache_tests(){
    test_hash_call();
    test_first_insert_wins();
    test_seeded_rng();
    std::cout << "Cache tests passed\n";
}
