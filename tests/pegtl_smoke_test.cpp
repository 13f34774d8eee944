#include <cassert>
#include <iostream>
#include <string>
#include <tao/pegtl.hpp>
#include "parser/grammar.hpp"

namespace pegtl = tao::pegtl;

template<typename Rule>
static bool matches(const std::string& text){
    pegtl::memory_input<> in(text, "smoke");
    return pegtl::parse< pegtl::seq< Rule, pegtl::eof > >(in);
}

void run_pegtl_smoke_test(){
    using namespace xylo::grammar;
    assert(matches<identifier>("spiral_2"));
    assert(matches<identifier>("iffy"));
    assert(!matches<identifier>("if"));
    assert(!matches<identifier>("2abc"));

    assert(matches<scalar>("42"));
    assert(matches<scalar>("-3.25"));
    assert(matches<scalar>(".5"));
    assert(matches<scalar>("#ff8000"));
    assert(matches<scalar>("#0f0"));
    assert(!matches<scalar>("#0f00"));
    assert(matches<scalar>("SQUARE"));
    assert(!matches<scalar>("SQUARES"));

    assert(matches<binary_operator>("**"));
    assert(matches<binary_operator>("..="));
    assert(!matches<op_sub>("->"));
    assert(matches<operator_name>("(+)"));
    assert(matches<arrow>("->"));
    std::cout << "PEGTL smoke test passed\n";
}
