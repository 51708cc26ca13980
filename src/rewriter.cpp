#include "sprig/rewriter.hpp"

namespace sprig {

node_ptr Rewriter::visit(const node_ptr& n){
    if(!n) return n;
    if(n->is_token()) return visit_token(std::static_pointer_cast<const token>(n));
    switch(n->kind()){
        case syntax_kind::document: return visit_document(n);
        case syntax_kind::class_declaration: return visit_class_declaration(n);
        case syntax_kind::code_block: return visit_code_block(n);
        case syntax_kind::directive: return visit_directive(n);
        case syntax_kind::directive_token: return visit_directive_token(n);
        case syntax_kind::design_time_directive: return visit_design_time_directive(n);
        case syntax_kind::field_declaration: return visit_field_declaration(n);
        case syntax_kind::markup_text: return visit_markup_text(n);
        case syntax_kind::code_literal: return visit_code_literal(n);
        case syntax_kind::keyword: case syntax_kind::identifier: case syntax_kind::whitespace:
        case syntax_kind::new_line: case syntax_kind::transition: case syntax_kind::left_brace:
        case syntax_kind::right_brace: case syntax_kind::semicolon: case syntax_kind::text:
        case syntax_kind::code:
            break; // token kinds on a non-token node: treat generically
    }
    return visit_default(n);
}

node_ptr Rewriter::visit_token(const token_ptr& t){
    if(!visit_into_trivia_) return t;
    bool changed = false;
    auto leading = visit_trivia_list(t->leading_trivia(), changed);
    auto trailing = visit_trivia_list(t->trailing_trivia(), changed);
    if(!changed) return t;
    return t->with_trivia(std::move(leading), std::move(trailing));
}

trivia_list Rewriter::visit_trivia_list(const trivia_list& list, bool& changed){
    trivia_list out;
    out.reserve(list.size());
    for(auto& tr : list){
        out.push_back(visit_trivia(tr));
        if(out.back() != tr) changed = true;
    }
    return out;
}

node_ptr Rewriter::visit_default(const node_ptr& n){
    const auto& children = n->children();
    node_list rebuilt;
    rebuilt.reserve(children.size());
    bool changed = false;
    for(auto& ch : children){
        auto r = visit(ch);
        if(r.get() != ch.get()) changed = true;
        if(r) rebuilt.push_back(std::move(r));
    }
    if(!changed) return n;
    return n->with_children(std::move(rebuilt));
}

} // namespace sprig
