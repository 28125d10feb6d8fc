// PEGTL grammar for engine identifiers and the reference engine's statement language
#pragma once
#include <tao/pegtl.hpp>

namespace rlink::grammar {
using namespace tao::pegtl;

struct ws : star< blank > {};

struct identifier : seq< alpha, star< sor< alnum, one<'_'> > > > {};
struct identifier_only : seq< identifier, eof > {};

// Literals: 1, -2.5, 3e4, 'text' ('' escapes a quote)
struct number : seq< opt< one<'+','-'> >, plus< digit >, opt< one<'.'>, star< digit > >,
                     opt< one<'e','E'>, opt< one<'+','-'> >, plus< digit > > > {};
struct string_body : star< sor< two<'\''>, not_one<'\''> > > {};
struct string_lit : seq< one<'\''>, string_body, one<'\''> > {};

// Role-specific rules so actions can tell positions apart
struct arg_string : string_lit {};
struct arg_number : number {};
struct arg_identifier : identifier {};
struct argument : sor< arg_string, arg_number, arg_identifier > {};
struct arg_list : opt< list< argument, one<','>, blank > > {};

struct callee : identifier {};
// Lookahead guards (actions are disabled inside at<>) keep failed alternatives from touching state
struct call : seq< at< identifier, ws, one<'('> >, callee, ws, one<'('>, ws, arg_list, ws, one<')'> > {};
struct source_identifier : identifier {};
struct rhs : sor< call, source_identifier > {};

struct target_name : identifier {};
struct target_list : seq< one<'['>, ws, list< target_name, one<','>, blank >, ws, one<']'> > {};
struct lhs : sor< target_list, target_name > {};
struct lhs_lookahead : seq< sor< seq< one<'['>, ws, list< identifier, one<','>, blank >, ws, one<']'> >, identifier >, ws, one<'='> > {};
struct assignment : seq< at< lhs_lookahead >, lhs, ws, one<'='>, ws, rhs > {};

struct clear_kw : tao::pegtl::keyword<'c','l','e','a','r'> {};
struct clear_name : identifier {};
struct clear_cmd : seq< clear_kw, ws, opt< list< clear_name, plus< blank > > > > {};

struct terminator : seq< ws, opt< one<';'> >, ws, eof > {};
struct statement : seq< ws, sor< assignment, call, clear_cmd >, terminator > {};
struct expression : seq< ws, rhs, terminator > {};

} // namespace rlink::grammar
