#pragma once
#include <tao/pegtl.hpp>

namespace lmm::pegtl_front::grammar {
using namespace tao::pegtl;

// Header text runs from '@' up to the opening '{' (excluded), with embedded
// newlines already folded to spaces.
struct at_sign : one<'@'> {};
struct name_char : sor< alnum, one<'_','-'> > {};
struct block_name : plus< name_char > {};
// Nothing between the name and '{'
struct name_at_end : eof {};
struct blanks : star< space > {};

// Bare arguments stop at whitespace, '[' or '+'
struct arg : plus< not_one<' ','\t','\n','\r','\v','\f','[','+'> > {};
struct args : star< arg, blanks > {};

// [k=v, k2=v2] - no nesting, the first ']' ends the list
struct param_token : star< not_one<',',']'> > {};
struct param_sep : one<','> {};
struct param_close : one<']'> {};
struct params : seq< one<'['>, param_token, star< param_sep, param_token >, opt< param_close > > {};

struct plus_mark : one<'+'> {};
struct plus_marks : star< plus_mark > {};

struct header_rule : seq< at_sign, block_name, opt< name_at_end >, blanks, args,
                          opt< params, blanks >, plus_marks, star< any > > {};

} // namespace lmm::pegtl_front::grammar
