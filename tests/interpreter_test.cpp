#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include "xylo/interpreter.hpp"
#include "xylo/parser.hpp"
#include "test_helpers.hpp"

using namespace xylo;

static ReduceOptions sequential(const char* seed = "tests"){
    ReduceOptions o;
    o.seed = seed_from_string(seed);
    o.threads = 1;
    return o;
}

static ShapePtr reduce_text(const std::string& src, ReduceOptions o = sequential()){
    Interpreter in(std::move(o));
    return in.reduce(parse(src));
}

static Value run_text(const std::string& src, const std::string& entry){
    Interpreter in(sequential());
    return in.run(parse(src), entry);
}

static void test_root_square(){
    auto s = reduce_text("root = SQUARE");
    auto items = flatten(*s);
    assert(items.size()==1 && items[0].kind==ShapeKind::Square && items[0].transform.is_identity());
    assert(shapes_equal(s, reduce(parse("root = SQUARE"), std::nullopt)));
}

static void test_if_is_lazy(){
    auto s = reduce_text("root = if true -> SQUARE; else -> CIRCLE");
    assert(flatten(*s).at(0).kind == ShapeKind::Square);
    // the untaken branch would fail if it were evaluated
    auto t = reduce_text("root = if 1 < 2 -> CIRCLE; else -> no_such_function 3");
    assert(flatten(*t).at(0).kind == ShapeKind::Circle);
    auto m = reduce_text("root = match 2 -> 1 -> missing; 2 -> TRIANGLE; _ -> missing");
    assert(flatten(*m).at(0).kind == ShapeKind::Triangle);
}

static void check_translated_squares(unsigned threads){
    ReduceOptions o = sequential();
    o.threads = threads;
    auto s = reduce_text("squares = for i in 0..3 -> tx i SQUARE\nroot = collect squares", o);
    auto items = flatten(*s);
    assert(items.size()==3);
    for(int i = 0; i < 3; ++i){
        assert(items[i].kind == ShapeKind::Square);
        assert(items[i].transform.tx == static_cast<float>(i) && items[i].transform.ty == 0.0f);
    }
}

static void test_values(){
    assert(run_text("n = 2 + 3 * 4", "n") == Value(std::int32_t{14}));
    assert(run_text("n = 1 + 0.5", "n") == Value(1.5f));
    assert(run_text("count n = if n == 0 -> 0; else -> 1 + count (n - 1)\nmain = count 10", "main") == Value(std::int32_t{10}));
    assert(run_text("xs = loop 3 -> 7", "xs") == Value::list({Value(std::int32_t{7}), Value(std::int32_t{7}), Value(std::int32_t{7})}));
    assert(run_text("xs = for x in [1, 2] -> x * 10", "xs") == Value::list({Value(std::int32_t{10}), Value(std::int32_t{20})}));
    assert(run_text("xs = for x in 2.0 -> x", "xs") == Value::list({Value(std::int32_t{0}), Value(std::int32_t{1})}));
    assert(run_text("b = match 2 -> 1, 2 -> true; _ -> false", "b") == Value(true));
    assert(run_text("b = match 2.0 -> 2 -> true; _ -> false", "b") == Value(true));
    assert(run_text("b = match 2 -> [1, 2] -> true; _ -> false", "b") == Value(true));
    assert(run_text("b = match 3 -> [1, 2] -> true; _ -> false", "b") == Value(false));
    assert(run_text("c = #ff0000", "c") == Value(std::int32_t{0xff0000}));
    assert(run_text("w = width", "w") == Value(std::int32_t{400}));
}

static void test_scoping(){
    assert(run_text("v = let x = 2; f y = y * x -> f 3", "v") == Value(std::int32_t{6}));
    // inner let shadows outer, functions see their defining scope
    assert(run_text("v = let x = 1; f = x -> let x = 5 -> f + x", "v") == Value(std::int32_t{6}));
    // builtins win over parameters and globals of the same name
    assert(throws_kind(ErrorKind::InvalidArgument, []{ run_text("f s = s + 1\nv = f 4", "v"); }));
    assert(throws_kind(ErrorKind::InvalidArgument, []{ reduce_text("h = SQUARE\nroot = h"); }));
    // globals do not see the caller's locals
    assert(throws_kind(ErrorKind::UnknownFunction, []{ run_text("g = x\nv = let x = 1 -> g", "v"); }));
    assert(throws_kind(ErrorKind::InvalidArgument, []{ run_text("v = let x = 1 -> x 2", "v"); }));
}

static void test_errors(){
    assert(throws_kind(ErrorKind::InvalidRoot, []{ reduce_text("root = 1"); }));
    assert(throws_kind(ErrorKind::UnknownFunction, []{ reduce_text("main = SQUARE"); }));
    assert(throws_kind(ErrorKind::InvalidArgument, []{ reduce_text("f a = a\nroot = f"); }));
    assert(throws_kind(ErrorKind::InvalidCondition, []{ reduce_text("root = if 1 -> SQUARE; else -> CIRCLE"); }));
    assert(throws_kind(ErrorKind::MatchNotFound, []{ reduce_text("root = match 3 -> 1 -> SQUARE; 2 -> CIRCLE"); }));
    assert(throws_kind(ErrorKind::InvalidMatch, []{ reduce_text("root = match true -> 1 -> SQUARE; _ -> CIRCLE"); }));
    assert(throws_kind(ErrorKind::InvalidMatch, []{ reduce_text("root = match SQUARE -> 1 -> SQUARE; _ -> CIRCLE"); }));
    // list scrutinees never match; list patterns need items of the scrutinee's kind
    assert(throws_kind(ErrorKind::InvalidMatch, []{ reduce_text("root = match [1, 2] -> [1, 2] -> SQUARE; _ -> CIRCLE"); }));
    assert(throws_kind(ErrorKind::InvalidMatch, []{ reduce_text("root = match 2.0 -> [1, 2] -> SQUARE; _ -> CIRCLE"); }));
    assert(throws_kind(ErrorKind::NegativeNumber, []{ reduce_text("root = collect (loop -1 -> SQUARE)"); }));
    assert(throws_kind(ErrorKind::NotIterable, []{ reduce_text("root = collect (for i in true -> SQUARE)"); }));
    assert(throws_kind(ErrorKind::InvalidList, []{ reduce_text("root = collect (for i in 0..2 -> if i == 0 -> SQUARE; else -> 1)"); }));
    assert(throws_kind(ErrorKind::InvalidDefinition, []{ reduce_text("f a = a\nf b = b\nroot = SQUARE"); }));
    assert(throws_kind(ErrorKind::InvalidDefinition, []{ reduce_text("f a a = a\nroot = SQUARE"); }));
    assert(throws_kind(ErrorKind::InvalidDefinition, []{ reduce_text("f@0 = SQUARE\nf@0 = CIRCLE\nroot = f"); }));

    ReduceOptions shallow = sequential();
    shallow.maxDepth = 64;
    assert(throws_kind(ErrorKind::MaxDepthReached, [&]{ reduce_text("f n = f (n + 1)\nroot = f 0", shallow); }));

    bool threw = false;
    try { reduce_text("root = nope"); }
    catch (const error& e){ threw = true; assert(e.name == "nope" && std::string(e.code()) != ""); }
    assert(threw);
}

static void test_cache(){
    const char* src = "sq n = t n n SQUARE\nroot = sq 1 : sq 1";
    Interpreter cached(sequential());
    auto a = cached.reduce(parse(src));
    auto st = cached.stats();
    assert(st.bodyEvaluations == 2);
    assert(st.cacheHits == 1);

    ReduceOptions off = sequential();
    off.cache = false;
    Interpreter uncached(off);
    auto b = uncached.reduce(parse(src));
    assert(uncached.stats().bodyEvaluations == 3);
    assert(uncached.stats().cacheHits == 0);
    assert(shapes_equal(a, b));

    // weighted and random functions are never memoized
    Interpreter in(sequential());
    in.reduce(parse("jitter = t rand 0 SQUARE\nroot = jitter : jitter"));
    assert(in.stats().bodyEvaluations == 3);

    // the calling global is part of the key
    Interpreter scoped(sequential());
    auto c = scoped.reduce(parse("sq n = t n n SQUARE\nleft = sq 1\nright = sq 1\nroot = left : right"));
    assert(scoped.stats().bodyEvaluations == 5);
    assert(scoped.stats().cacheHits == 0);
    assert(shapes_equal(a, c));
}

static void check_loop_locals(unsigned threads){
    ReduceOptions o = sequential();
    o.threads = threads;
    // every iteration sees its own binding, never another iteration's result
    auto s = reduce_text("root = collect (for i in 0..3 -> let f = tx i SQUARE -> f)", o);
    auto items = flatten(*s);
    assert(items.size() == 3);
    for(int i = 0; i < 3; ++i) assert(items[i].transform.tx == static_cast<float>(i));

    auto g = reduce_text("root = collect (for i in 0..3 -> let g d = tx (i + d) SQUARE -> g 10)", o);
    auto moved = flatten(*g);
    assert(moved.size() == 3);
    for(int i = 0; i < 3; ++i) assert(moved[i].transform.tx == static_cast<float>(10 + i));
}

static void test_determinism(){
    const char* src =
        "pick@1 = SQUARE\n"
        "pick@2 = CIRCLE\n"
        "cell i = tx (rand_range 0.0 10.0) (r (i * 10) pick)\n"
        "root = collect (for i in 0..20 -> cell i)\n";
    auto a = reduce_text(src, sequential("seed-a"));
    auto b = reduce_text(src, sequential("seed-a"));
    assert(shapes_equal(a, b));
    assert(flatten(*a).size() == 20);

    // zero weight never gets picked
    auto only = reduce_text("pick@0 = CIRCLE\npick@1 = SQUARE\nroot = collect (loop 16 -> pick)");
    for(auto& item : flatten(*only)) assert(item.kind == ShapeKind::Square);
}

static void test_parallel(){
    ReduceOptions o = sequential();
    o.threads = 4;
    auto s = reduce_text("tree n = if n == 0 -> SQUARE; else -> tree (n - 1) : tx 1 (tree (n - 1))\nroot = tree 6", o);
    assert(flatten(*s).size() == 64);
    check_translated_squares(4);
    check_loop_locals(4);
}

void run_interpreter_tests(){
    test_root_square();
    test_if_is_lazy();
    check_translated_squares(1);
    test_values();
    test_scoping();
    check_loop_locals(1);
    test_errors();
    test_cache();
    test_determinism();
    test_parallel();
    std::cout << "Interpreter tests passed\n";
}
