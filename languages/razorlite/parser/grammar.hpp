#pragma once
#include <tao/pegtl.hpp>

namespace razorlite::grammar {
using namespace tao::pegtl;

// Every structural rule commits after its first character: the remaining parts
// either match or fall back to a `success` placeholder, so actions never fire
// for input that is later backtracked over.

struct ws : plus< blank > {};
struct nl : eol {};
struct text_run : plus< not_at< identifier_first >, not_one< '@', '{', '}', ' ', '\t', '\r', '\n' > > {};

struct member;

// class Name { members }
struct class_keyword : keyword< 'c', 'l', 'a', 's', 's' > {};
struct header_ws : ws {};
struct header_nl : nl {};
struct header_gap : sor< header_ws, header_nl > {};
struct class_name : identifier {};
struct class_name_missing : success {};
struct class_open : one< '{' > {};
struct class_open_missing : success {};
struct class_close : one< '}' > {};
struct class_close_missing : success {};
struct class_decl : seq< class_keyword,
                         star< header_gap >, sor< class_name, class_name_missing >,
                         star< header_gap >, sor< class_open, class_open_missing >,
                         star< member >,
                         sor< class_close, class_close_missing > > {};

// @name token token ;
struct transition : one< '@' > {};
struct directive_name : identifier {};
struct directive_name_missing : success {};
struct directive_ws : ws {};
struct directive_token_text : plus< not_one< ' ', '\t', '\r', '\n', ';', '{', '}' > > {};
struct directive_end : one< ';' > {};
struct directive_close : success {};
struct directive : seq< transition,
                        sor< directive_name, directive_name_missing >,
                        star< sor< directive_ws, directive_token_text > >,
                        opt< directive_end >,
                        directive_close > {};

// { members } nested inside a class
struct block_open : one< '{' > {};
struct block_close : one< '}' > {};
struct block_close_missing : success {};
struct code_block : seq< block_open, star< member >, sor< block_close, block_close_missing > > {};

struct code_ws : ws {};
struct code_nl : nl {};
struct code_word : identifier {};
struct code_text : text_run {};
struct code_any : not_one< '{', '}' > {};
struct member : sor< code_nl, code_ws, class_decl, directive, code_block, code_word, code_text, code_any > {};

struct markup_ws : ws {};
struct markup_nl : nl {};
struct markup_word : identifier {};
struct markup_text : plus< not_at< identifier_first >, not_one< '@', ' ', '\t', '\r', '\n' > > {};
struct markup_any : any {};
struct top_item : sor< markup_nl, markup_ws, class_decl, directive, markup_word, markup_text, markup_any > {};

struct document : seq< star< top_item >, eof > {};

} // namespace razorlite::grammar
