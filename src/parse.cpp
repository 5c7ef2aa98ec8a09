// PEGTL front end for .env documents: parse() and parse_string().
#include "envsync/env_file.hpp"
#include "pegtl/prelude.hpp"
#include "pegtl/grammar.hpp"
#include "pegtl/actions.hpp"
#include <tao/pegtl.hpp>

namespace envsync {
using namespace envsync::pegtl_front;

env_file parse(std::string_view text){
    tao::pegtl::memory_input in(text.data(), text.size(), "<memory>");
    parse_state st;
    // bad_line matches any line the other rules reject, so document always reaches eof
    tao::pegtl::parse< grammar::document, actions::action >(in, st);
    return std::move(st.file);
}

ParseResult parse_string(std::string_view src, std::string_view filename){
    ParseResult r;
    try {
        r.file = parse(src);
        r.success = true;
    } catch (const invalid_line& e) {
        r.error_message = std::string(filename) + ":" + std::to_string(e.line()) + ": " + e.what();
        r.line = e.line();
        r.raw_line = e.raw();
    }
    return r;
}

} // namespace envsync
