#include "sprig/syntax.hpp"

#include <algorithm>

namespace sprig {

const char* kind_name(syntax_kind k){
    switch(k){
        case syntax_kind::document: return "Document";
        case syntax_kind::class_declaration: return "ClassDeclaration";
        case syntax_kind::code_block: return "CodeBlock";
        case syntax_kind::directive: return "Directive";
        case syntax_kind::directive_token: return "DirectiveToken";
        case syntax_kind::design_time_directive: return "DesignTimeDirective";
        case syntax_kind::field_declaration: return "FieldDeclaration";
        case syntax_kind::markup_text: return "MarkupText";
        case syntax_kind::code_literal: return "CodeLiteral";
        case syntax_kind::keyword: return "Keyword";
        case syntax_kind::identifier: return "Identifier";
        case syntax_kind::whitespace: return "Whitespace";
        case syntax_kind::new_line: return "NewLine";
        case syntax_kind::transition: return "Transition";
        case syntax_kind::left_brace: return "LeftBrace";
        case syntax_kind::right_brace: return "RightBrace";
        case syntax_kind::semicolon: return "Semicolon";
        case syntax_kind::text: return "Text";
        case syntax_kind::code: return "Code";
    }
    return "Unknown";
}

bool is_token_kind(syntax_kind k){
    switch(k){
        case syntax_kind::keyword: case syntax_kind::identifier: case syntax_kind::whitespace:
        case syntax_kind::new_line: case syntax_kind::transition: case syntax_kind::left_brace:
        case syntax_kind::right_brace: case syntax_kind::semicolon: case syntax_kind::text:
        case syntax_kind::code:
            return true;
        default:
            return false;
    }
}

const char* accepted_characters_name(accepted_characters a){
    switch(a){
        case accepted_characters::none: return "None";
        case accepted_characters::any: return "Any";
        case accepted_characters::non_whitespace: return "NonWhitespace";
        case accepted_characters::whitespace: return "Whitespace";
        case accepted_characters::new_line: return "NewLine";
        case accepted_characters::any_except_new_line: return "AnyExceptNewline";
    }
    return "Unknown";
}

std::string edit_handler::to_string() const {
    return name + ";Accepts:" + accepted_characters_name(accepts);
}

// --- node -------------------------------------------------------------------

static size_t sum_widths(const node_list& children){
    size_t w = 0;
    for(auto& c : children) w += c->full_width();
    return w;
}

// Null entries are dropped, as in Rewriter::visit_default.
static node_list without_nulls(node_list children){
    children.erase(std::remove(children.begin(), children.end(), nullptr), children.end());
    return children;
}

node::node(syntax_kind kind, size_t position, node_list children, annotation_map annotations, diagnostic_list diagnostics)
    : kind_(kind), position_(position), full_width_(0), children_(without_nulls(std::move(children))),
      annotations_(std::move(annotations)), diagnostics_(std::move(diagnostics)) {
    full_width_ = sum_widths(children_);
}

node::node(syntax_kind kind, size_t position, size_t full_width, annotation_map annotations, diagnostic_list diagnostics)
    : kind_(kind), position_(position), full_width_(full_width), annotations_(std::move(annotations)), diagnostics_(std::move(diagnostics)) {}

std::string node::to_full_string() const {
    std::string out;
    for(auto& c : children_) out += c->to_full_string();
    return out;
}

std::string node::to_string() const {
    std::string full = to_full_string();
    // strip the outer trivia of the first/last descendant tokens
    const node* first = this; while(!first->is_token() && !first->children().empty()) first = first->children().front().get();
    const node* last = this; while(!last->is_token() && !last->children().empty()) last = last->children().back().get();
    size_t lead = 0, trail = 0;
    if(first->is_token()) for(auto& t : static_cast<const token*>(first)->leading_trivia()) lead += t.text.size();
    if(last->is_token()) for(auto& t : static_cast<const token*>(last)->trailing_trivia()) trail += t.text.size();
    if(lead + trail >= full.size()) return {};
    return full.substr(lead, full.size() - lead - trail);
}

node_ptr node::with_children(node_list children) const {
    return std::make_shared<node>(kind_, position_, std::move(children), annotations_, diagnostics_);
}

node_ptr node::with_annotations(annotation_map annotations) const {
    return std::make_shared<node>(kind_, position_, children_, std::move(annotations), diagnostics_);
}

node_ptr node::with_diagnostics(diagnostic_list diagnostics) const {
    return std::make_shared<node>(kind_, position_, children_, annotations_, std::move(diagnostics));
}

// --- token ------------------------------------------------------------------

static size_t trivia_width(const trivia_list& list){
    size_t w = 0;
    for(auto& t : list) w += t.text.size();
    return w;
}

token::token(syntax_kind kind, size_t position, std::string content, flags f, trivia_list leading, trivia_list trailing,
             annotation_map annotations, diagnostic_list diagnostics)
    : node(kind, position,
           (f.missing || f.synthesized) ? 0 : trivia_width(leading) + content.size() + trivia_width(trailing),
           std::move(annotations), std::move(diagnostics)),
      content_(std::move(content)), flags_(f), leading_(std::move(leading)), trailing_(std::move(trailing)) {}

std::string token::to_full_string() const {
    if(flags_.missing) return {};
    std::string out;
    for(auto& t : leading_) out += t.text;
    out += content_;
    for(auto& t : trailing_) out += t.text;
    return out;
}

node_ptr token::with_children(node_list) const { return shared_from_this(); }

node_ptr token::with_annotations(annotation_map annotations) const {
    return std::make_shared<token>(kind_, position_, content_, flags_, leading_, trailing_, std::move(annotations), diagnostics_);
}

node_ptr token::with_diagnostics(diagnostic_list diagnostics) const {
    return std::make_shared<token>(kind_, position_, content_, flags_, leading_, trailing_, annotations_, std::move(diagnostics));
}

token_ptr token::with_trivia(trivia_list leading, trivia_list trailing) const {
    return std::make_shared<token>(kind_, position_, content_, flags_, std::move(leading), std::move(trailing), annotations_, diagnostics_);
}

// --- factories --------------------------------------------------------------

node_ptr make_node(syntax_kind kind, size_t position, node_list children, annotation_map annotations, diagnostic_list diagnostics){
    return std::make_shared<node>(kind, position, std::move(children), std::move(annotations), std::move(diagnostics));
}

token_ptr make_token(syntax_kind kind, size_t position, std::string content, diagnostic_list diagnostics,
                     trivia_list leading, trivia_list trailing){
    return std::make_shared<token>(kind, position, std::move(content), token::flags{}, std::move(leading), std::move(trailing),
                                   annotation_map{}, std::move(diagnostics));
}

token_ptr make_missing_token(syntax_kind kind, size_t position, diagnostic_list diagnostics){
    return std::make_shared<token>(kind, position, std::string(), token::flags{true, false}, trivia_list{}, trivia_list{},
                                   annotation_map{}, std::move(diagnostics));
}

token_ptr make_synthesized_token(syntax_kind kind, size_t position, std::string content){
    return std::make_shared<token>(kind, position, std::move(content), token::flags{false, true});
}

annotation_map make_span_context_annotation(std::string chunk_generator, edit_handler handler){
    annotation_map m;
    m.emplace(span_context_kind, span_context{std::move(chunk_generator), std::move(handler)});
    return m;
}

} // namespace sprig
