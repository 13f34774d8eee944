#include <iostream>
#include <fstream>
#include <sstream>
#include "xylo/diagnostics_json.hpp"
#include "xylo/minify.hpp"
#include "xylo/parser.hpp"

using namespace xylo;

static std::string read_file(const std::string& path){ std::ifstream ifs(path); std::stringstream ss; ss<<ifs.rdbuf(); return ss.str(); }

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: xylo_minify <script>\n"; return 1; }
    std::string src = read_file(argv[1]); if(src.empty()){ std::cerr << "failed to read file\n"; return 1; }
    auto parsed = try_parse(src);
    if(!parsed.success){
        std::cerr << parsed.error_message << "\n";
        maybe_print_json(parse_error(parsed.error_message, parsed.line, parsed.column));
        return 2;
    }
    std::cout << minify(parsed.tree) << "\n";
    return 0;
}
