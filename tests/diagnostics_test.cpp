#include <cassert>
#include <iostream>
#include <string>
#include "xylo/diagnostics_json.hpp"
#include "xylo/parser.hpp"
#include "test_env.hpp"

using namespace xylo;

static void test_escape(){
    assert(json_escape("plain") == "\"plain\"");
    assert(json_escape("a\"b\\c\n") == "\"a\\\"b\\\\c\\n\"");
    assert(json_escape(std::string(1, '\x01')) == "\"\\u0001\"");
}

static void test_parse_error_json(){
    bool threw = false;
    try { parse("a = 1\nb = )"); }
    catch (const parse_error& e){
        threw = true;
        std::string js = error_to_json(e);
        assert(js.find("\"code\":\"X0001\"") != std::string::npos);
        assert(js.find("\"kind\":\"ParseError\"") != std::string::npos);
        assert(js.find("\"line\":2") != std::string::npos);
    }
    assert(threw);
}

static void test_reduce_error_json(){
    std::string js = error_to_json(unknown_function("spiral"));
    assert(js.find("\"code\":\"X0002\"") != std::string::npos);
    assert(js.find("\"name\":\"spiral\"") != std::string::npos);
    assert(js.find("\"line\":-1,\"col\":-1") != std::string::npos);
    // message quoting survives escaping
    assert(js.find("`spiral`") != std::string::npos);

    _putenv("XYLO_DIAG_JSON=1");
    maybe_print_json(make_error(ErrorKind::InvalidRoot));
    _putenv("XYLO_DIAG_JSON=");
}

void run_diagnostics_tests(){
    test_escape();
    test_parse_error_json();
    test_reduce_error_json();
    std::cout << "Diagnostics tests passed\n";
}
