#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <fstream>
#include <sstream>
#include "xylo/xylo.hpp"

using namespace xylo;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

static bool parse_dimension(const char* s, std::uint32_t& out){
    char* end = nullptr;
    unsigned long v = std::strtoul(s, &end, 10);
    if(end == s || *end != '\0' || v == 0 || v > 100000) return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: xylo_driver <script> [seed] [width] [height]\n"; return 1; }
    std::string src = read_file(argv[1]); if(src.empty()){ std::cerr << "failed to read file\n"; return 1; }
    ReduceOptions options = ReduceOptions::from_env();
    if(argc>2) options.seed = seed_from_string(argv[2]);
    if(argc>3 && !parse_dimension(argv[3], options.width)){ std::cerr << "invalid width: " << argv[3] << "\n"; return 1; }
    if(argc>4 && !parse_dimension(argv[4], options.height)){ std::cerr << "invalid height: " << argv[4] << "\n"; return 1; }

    auto parsed = try_parse(src);
    if(!parsed.success){
        std::cerr << parsed.error_message << "\n";
        maybe_print_json(parse_error(parsed.error_message, parsed.line, parsed.column));
        return 2;
    }
    try {
        Interpreter in(options);
        ShapePtr root = in.reduce(parsed.tree);
        std::cout << "canvas " << options.width << "x" << options.height << "\n";
        for(auto& item : flatten(*root, options.width, options.height)){
            const Transform& t = item.transform;
            std::cout << shape_keyword(item.kind)
                      << " transform(" << format_float(t.sx) << "," << format_float(t.kx) << "," << format_float(t.ky) << ","
                      << format_float(t.sy) << "," << format_float(t.tx) << "," << format_float(t.ty) << ")"
                      << " hsla(" << format_float(item.color.h) << "," << format_float(item.color.s) << ","
                      << format_float(item.color.l) << "," << format_float(item.color.a) << ")\n";
        }
        if(options.trace){
            auto st = in.stats();
            std::fprintf(stderr, "[xylo][stats] calls=%llu bodies=%llu hits=%llu misses=%llu\n",
                (unsigned long long)st.calls, (unsigned long long)st.bodyEvaluations,
                (unsigned long long)st.cacheHits, (unsigned long long)st.cacheMisses);
        }
    } catch (const error& e){
        std::cerr << "error[" << e.code() << "]: " << e.what() << "\n";
        maybe_print_json(e);
        return 3;
    }
    return 0;
}
