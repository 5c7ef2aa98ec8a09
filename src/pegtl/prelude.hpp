#pragma once
#include "envsync/env_file.hpp"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace envsync::pegtl_front {

// Accumulates entries while the grammar walks the document line by line.
struct parse_state {
    env_file file;
    std::vector<comment> pending; // comment lines not yet bound to a variable
    variable current;             // assignment under construction

    // Comments not followed by a variable become one orphan entry per line.
    void flush_pending(){
        for(auto& c : pending) file.entries.emplace_back(orphan_comment{std::move(c)});
        pending.clear();
    }
};

inline bool is_trim_space(char c){ return c==' ' || c=='\t' || c=='\r' || c=='\n' || c=='\v' || c=='\f'; }

inline std::string trim(std::string_view s){
    size_t b = 0, e = s.size();
    while(b < e && is_trim_space(s[b])) ++b;
    while(e > b && is_trim_space(s[e-1])) --e;
    return std::string(s.substr(b, e - b));
}

} // namespace envsync::pegtl_front
