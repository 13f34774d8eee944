#include "xylo/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace xylo {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string error_to_json(const error& e){
    int line = -1, col = -1;
    if(auto* pe = dynamic_cast<const parse_error*>(&e)){ line = pe->line; col = pe->col; }
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(e.code())
      <<",\"kind\":"<<json_escape(kind_name(e.kind))
      <<",\"message\":"<<json_escape(e.what())
      <<",\"name\":"<<json_escape(e.name)
      <<",\"line\":"<<line
      <<",\"col\":"<<col
      <<"}";
    return os.str();
}

void maybe_print_json(const error& e){
    if(const char* env = std::getenv("XYLO_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=error_to_json(e);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace xylo
