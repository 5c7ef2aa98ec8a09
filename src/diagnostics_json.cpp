#include "envsync/diagnostics_json.hpp"
#include "envsync/config.hpp"
#include <sstream>
#include <cstdio>

namespace envsync {

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

std::string diagnostics_to_json(const sync_error& e){
    std::ostringstream os;
    os<<"{\"success\":false,\"error\":{"
        "\"code\":"<<json_escape(to_string(e.code()))
      <<",\"message\":"<<json_escape(e.what())
      <<",\"path\":"<<json_escape(e.path().string());
    if(e.code()==sync_errc::local_parse || e.code()==sync_errc::template_parse){
        os<<",\"line\":"<<e.line()
          <<",\"raw_line\":"<<json_escape(e.raw_line());
    }
    os<<"}}";
    return os.str();
}

void maybe_print_json(const sync_error& e){
    if(detectEnv().diagJson){
        auto js=diagnostics_to_json(e);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace envsync
