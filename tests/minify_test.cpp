#include <cassert>
#include <iostream>
#include <string>
#include "xylo/interpreter.hpp"
#include "xylo/minify.hpp"
#include "xylo/parser.hpp"

using namespace xylo;

static const char* kScript =
    "shape@2 n = if n <= 0 -> SQUARE; else -> t 1 (n * 0.5) (shape (n - 1))\n"
    "shape@0.5 n = CIRCLE\n"
    "pick x = match x -> 1, 2 -> SQUARE; [3, 4] -> CIRCLE; -1 -> TRIANGLE; _ -> FILL\n"
    "grid = collect (for i in 0..=3 -> let d = i * 2; f y = tx y SQUARE -> f d)\n"
    "many = collect (loop 4 -> hex #ff8000 (r 45 SQUARE))\n"
    "chain n = if n < 0 -> 0; else if n == 0 -> 1.5; else -> 2.0 ** n\n"
    "root = shape 3 : pick 2 : grid : many : ss (chain 2) CIRCLE\n";

static void test_forms(){
    assert(minify(std::string_view("root = 1 + 2 * 3")) == "root=(1+(2*3))");
    assert(minify(std::string_view("x = f g 1")) == "x=(f g 1)");
    assert(minify(std::string_view("x = (+) 1 2")) == "x=((+) 1 2)");
    assert(minify(std::string_view("x = if a -> 1; else -> 2")) == "x=(if a->1;else->2)");
    assert(minify(std::string_view("x = for v in xs -> v")) == "x=(for v in xs->v)");
    assert(minify(std::string_view("x = loop 3 -> 1.0")) == "x=(loop 3->1.0)");
    assert(minify(std::string_view("f@2 a b = a\nf@2 a b = b")) == "f@2.0 a b=a\nf@2.0 a b=b");
}

static void test_round_trip(){
    Tree original = parse(kScript);
    std::string small = minify(original);
    assert(small.find('\n') != std::string::npos);
    Tree again = parse(small);
    assert(again == original);
    assert(minify(again) == small);

    ReduceOptions o;
    o.seed = seed_from_string("minify");
    o.threads = 1;
    Interpreter a(o), b(o);
    assert(shapes_equal(a.reduce(original), b.reduce(again)));
}

void run_minify_tests(){
    test_forms();
    test_round_trip();
    std::cout << "Minify tests passed\n";
}
