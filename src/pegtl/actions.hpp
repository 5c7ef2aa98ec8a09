#pragma once
#include "prelude.hpp"
#include "grammar.hpp"
#include <tao/pegtl.hpp>

namespace envsync::pegtl_front::actions {
using namespace tao::pegtl;
using envsync::pegtl_front::parse_state;

template<typename Rule>
struct action : nothing<Rule> {};

template<> struct action< grammar::blank_line > {
    template<typename Input>
    static void apply(const Input&, parse_state& st){
        st.flush_pending();
        st.file.entries.emplace_back(empty_line{});
    }
};

template<> struct action< grammar::comment_body > {
    template<typename Input>
    static void apply(const Input& in, parse_state& st){ st.pending.push_back(make_comment(in.string())); }
};

template<> struct action< grammar::key > {
    template<typename Input>
    static void apply(const Input& in, parse_state& st){
        st.current = variable{};
        st.current.key = trim(in.string());
    }
};

template<> struct action< grammar::value > {
    template<typename Input>
    static void apply(const Input& in, parse_state& st){ st.current.value = trim(in.string()); }
};

template<> struct action< grammar::inline_body > {
    template<typename Input>
    static void apply(const Input& in, parse_state& st){ st.current.inline_comment = make_comment(in.string()); }
};

// Runs after key/value/inline_body: bind the pending comment run and emit.
template<> struct action< grammar::assignment > {
    template<typename Input>
    static void apply(const Input&, parse_state& st){
        st.current.preceding_comments = std::move(st.pending);
        st.pending.clear();
        st.file.entries.emplace_back(std::move(st.current));
        st.current = variable{};
    }
};

template<> struct action< grammar::bad_line > {
    template<typename Input>
    static void apply(const Input& in, parse_state&){
        throw invalid_line(trim(in.string()), static_cast<int>(in.position().line));
    }
};

// Comments trailing the file with nothing below them.
template<> struct action< grammar::document > {
    template<typename Input>
    static void apply(const Input&, parse_state& st){ st.flush_pending(); }
};

} // namespace envsync::pegtl_front::actions
