#pragma once
#include <tao/pegtl.hpp>

namespace envsync::pegtl_front::grammar {
using namespace tao::pegtl;

// Whitespace removed by line trimming; '\r' of CRLF input falls in here.
struct ws : one< ' ', '\t', '\r', '\v', '\f' > {};
struct line_end : sor< one< '\n' >, eof > {};

struct blank_line : seq< star< ws >, at< line_end > > {};

struct comment_body : star< not_one< '\n' > > {};
struct comment_line : seq< star< ws >, one< '#' >, comment_body > {};

// Key runs to the first '=', value to the first '#'; there is no escaping.
struct key : star< not_one< '=', '\n' > > {};
struct value : star< not_one< '#', '\n' > > {};
struct inline_body : star< not_one< '\n' > > {};
struct assignment : seq< at< key, one< '=' > >, key, one< '=' >, value, opt< one< '#' >, inline_body > > {};

struct bad_line : star< not_one< '\n' > > {};

struct line : seq< not_at< eof >, sor< blank_line, comment_line, assignment, bad_line >, line_end > {};
struct document : seq< star< line >, eof > {};

} // namespace envsync::pegtl_front::grammar
