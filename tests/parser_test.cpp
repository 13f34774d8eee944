#include <cassert>
#include <iostream>
#include "xylo/parser.hpp"
#include "test_helpers.hpp"

using namespace xylo;

static Token lit(literal_data d){ return Token{Literal{std::move(d)}}; }
static Token op(BinaryOperator o){ return Token{o}; }
static Token call(const char* name, size_t argc = 0){ return Token{CallToken{name, argc}}; }

static const Block& body(const Tree& t, size_t i = 0){ return t.at(i).block; }

static void test_precedence(){
    auto t = parse("root = 3 + 4.0 * 5.0");
    assert(t.size()==1 && t[0].name=="root" && t[0].params.empty());
    Block expected{lit(std::int32_t{3}), lit(4.0f), lit(5.0f), op(BinaryOperator::Multiplication), op(BinaryOperator::Addition)};
    assert(body(t)==expected);

    auto cmp = parse("x = 1 + 2 < 3 * 4");
    Block e2{lit(std::int32_t{1}), lit(std::int32_t{2}), op(BinaryOperator::Addition),
             lit(std::int32_t{3}), lit(std::int32_t{4}), op(BinaryOperator::Multiplication), op(BinaryOperator::LessThan)};
    assert(body(cmp)==e2);

    auto logic = parse("x = true || false && true");
    Block e3{lit(true), lit(false), lit(true), op(BinaryOperator::And), op(BinaryOperator::Or)};
    assert(body(logic)==e3);
}

static void test_left_associative(){
    auto t = parse("x = 1 - 2 - 3");
    Block expected{lit(std::int32_t{1}), lit(std::int32_t{2}), op(BinaryOperator::Subtraction),
                   lit(std::int32_t{3}), op(BinaryOperator::Subtraction)};
    assert(body(t)==expected);
}

static void test_calls(){
    auto t = parse("f a b = a\nroot = f 1 (g 2) + 3");
    assert(t.size()==2);
    assert((t[0].params==std::vector<std::string>{"a","b"}));
    Block expected{lit(std::int32_t{1}), lit(std::int32_t{2}), call("g",1), call("f",2), lit(std::int32_t{3}), op(BinaryOperator::Addition)};
    assert(body(t,1)==expected);

    auto named = parse("x = (+) 1 2");
    Block e2{lit(std::int32_t{1}), lit(std::int32_t{2}), call("+",2)};
    assert(body(named)==e2);

    // a call in argument position takes no arguments of its own
    auto nested = parse("x = f g 1");
    Block e3{call("g"), lit(std::int32_t{1}), call("f",2)};
    assert(body(nested)==e3);
}

static void test_literals(){
    auto t = parse("x = [1, [2, 3], #ff8000, #0f0, SQUARE, -7, .5, false]");
    auto& l = std::get<Literal>(body(t)[0].data);
    auto& items = std::get<LiteralList>(l.data).items;
    assert(items.size()==8);
    assert(std::get<LiteralList>(items[1].data).items.size()==2);
    auto hex = std::get<HexColor>(items[2].data);
    assert(hex.r==255 && hex.g==128 && hex.b==0);
    auto short_hex = std::get<HexColor>(items[3].data);
    assert(short_hex.r==0 && short_hex.g==255 && short_hex.b==0);
    assert(std::get<ShapeKind>(items[4].data)==ShapeKind::Square);
    assert(std::get<std::int32_t>(items[5].data)==-7);
    assert(std::get<float>(items[6].data)==0.5f);
    assert(std::get<bool>(items[7].data)==false);

    // too large for i32
    assert(!try_parse("x = 3000000000").success);
}

static void test_keyword_boundaries(){
    auto t = parse("iffy = trueish\nletters = SQUARES");
    assert(t[0].name=="iffy" && t[1].name=="letters");
    assert(body(t,0)==Block{call("trueish")});
    assert(body(t,1)==Block{call("SQUARES")});
}

static void test_if_layout(){
    auto t = parse("root = if true -> 1; else -> 2");
    Block expected{lit(true), Token{IfToken{2}}, lit(std::int32_t{1}), Token{JumpToken{2}}, lit(std::int32_t{2})};
    assert(body(t)==expected);

    auto chain = parse("x = if a -> 1; else if b -> 2; else -> 3");
    Block e2{call("a"), Token{IfToken{2}}, lit(std::int32_t{1}), Token{JumpToken{6}},
             call("b"), Token{IfToken{2}}, lit(std::int32_t{2}), Token{JumpToken{2}}, lit(std::int32_t{3})};
    assert(body(chain)==e2);

    auto multiline = parse("x = if a\n    1\n  else\n    2\n");
    Block e3{call("a"), Token{IfToken{2}}, lit(std::int32_t{1}), Token{JumpToken{2}}, lit(std::int32_t{2})};
    assert(body(multiline)==e3);
}

static void test_match_layout(){
    auto t = parse("x = match 1 -> 1, 2 -> 3; _ -> 4");
    MatchToken m;
    m.arms.push_back(MatchArm{PatternMatches{{Literal{std::int32_t{1}}, Literal{std::int32_t{2}}}}, 2});
    m.arms.push_back(MatchArm{PatternWildcard{}, 2});
    Block expected{lit(std::int32_t{1}), Token{m}, lit(std::int32_t{3}), Token{JumpToken{3}}, lit(std::int32_t{4}), Token{JumpToken{1}}};
    assert(body(t)==expected);

    // negative patterns stay patterns
    auto neg = parse("x = match n -> -1 -> 0; _ -> 1");
    auto& arms = std::get<MatchToken>(body(neg)[1].data).arms;
    assert(std::get<std::int32_t>(std::get<PatternMatches>(arms[0].pattern).literals[0].data)==-1);
}

static void test_let_for_loop_layout(){
    auto t = parse("x = let a = 1; b = 2 -> a + b");
    auto& let = std::get<LetToken>(body(t)[0].data);
    assert(let.defs.size()==2 && let.skip==4);
    assert(let.defs[0].name=="a" && let.defs[1].name=="b");
    assert(body(t).size()==4);

    auto f = parse("x = for i in 0..3 -> i");
    Block e2{lit(std::int32_t{0}), lit(std::int32_t{3}), op(BinaryOperator::Range), Token{ForToken{"i", 2}}, call("i")};
    assert(body(f)==e2);

    auto l = parse("x = loop 3 -> SQUARE");
    Block e3{lit(std::int32_t{3}), Token{LoopToken{2}}, lit(ShapeKind::Square)};
    assert(body(l)==e3);
}

static void test_definitions(){
    auto t = parse("f@2.5 = 1\nf = 2\n\ng@3 x = x");
    assert(t.size()==3);
    assert(t[0].weight==2.5f && t[1].weight==1.0f && t[2].weight==3.0f);

    auto semi = parse("a = 1; b = 2");
    assert(semi.size()==2 && semi[1].name=="b");

    auto eq = parse("same a b = a == b");
    assert(body(eq).back()==op(BinaryOperator::Equal));
}

static void test_indentation(){
    auto t = parse("f = 1\n  + 2");
    Block expected{lit(std::int32_t{1}), lit(std::int32_t{2}), op(BinaryOperator::Addition)};
    assert(body(t)==expected);

    auto r = try_parse("f = 1\n+ 2");
    assert(!r.success && r.line==2);
}

static void test_errors(){
    auto r = try_parse("root = ");
    assert(!r.success && r.line==1 && !r.error_message.empty());
    assert(throws_kind(ErrorKind::ParseError, []{ parse("root = (1 + 2"); }));
    bool caught = false;
    try { parse("a = 1\nb = )"); }
    catch (const parse_error& e){ caught = true; assert(e.line==2); assert(std::string(e.code())=="X0001"); }
    assert(caught);
}

void run_parser_tests(){
    test_precedence();
    test_left_associative();
    test_calls();
    test_literals();
    test_keyword_boundaries();
    test_if_layout();
    test_match_layout();
    test_let_for_loop_layout();
    test_definitions();
    test_indentation();
    test_errors();
    std::cout << "Parser tests passed\n";
}
