// Parse, reduce and minify every script under examples/.
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "xylo/interpreter.hpp"
#include "xylo/minify.hpp"
#include "xylo/parser.hpp"

using namespace xylo;

static std::string read_all(const std::filesystem::path& p){
    std::ifstream ifs(p, std::ios::binary); if(!ifs) return {};
    std::string s; ifs.seekg(0,std::ios::end); s.resize((size_t)ifs.tellg()); ifs.seekg(0); ifs.read(&s[0], s.size()); return s;
}

void run_examples_smoke(){
#ifndef XYLO_SOURCE_DIR
    std::cout << "[examples] smoke (no XYLO_SOURCE_DIR defined, skipping)\n";
    return;
#else
    std::filesystem::path dir = std::filesystem::path(XYLO_SOURCE_DIR)/"examples";
    std::vector<std::string> files = {"spiral.xylo", "forest.xylo", "grid.xylo", "shapes.xylo"};
    size_t failed = 0;
    for(auto& f : files){
        auto src = read_all(dir/f);
        if(src.empty()){ std::cerr << "[examples] missing: " << (dir/f) << "\n"; ++failed; continue; }
        try {
            Tree tree = parse(src);
            ReduceOptions o;
            o.seed = seed_from_string(f);
            o.threads = 1;
            Interpreter in(o);
            auto shape = in.reduce(tree);
            auto items = flatten(*shape, 400, 400);
            assert(!items.empty());
            assert(parse(minify(tree)) == tree);
        } catch (const error& e){
            std::cerr << "[examples] " << f << ": " << e.code() << " " << e.what() << "\n";
            ++failed;
        }
    }
    assert(failed == 0 && "example scripts failed");
    std::cout << "Examples smoke test passed\n";
#endif
}
