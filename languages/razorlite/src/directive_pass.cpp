#include "razorlite/razorlite.hpp"

#include <cctype>

namespace razorlite {

using sprig::node_ptr;
using sprig::syntax_kind;

std::vector<directive_descriptor> default_directives(){
    return { directive_descriptor{"inject", {directive_token_kind::type, directive_token_kind::member}} };
}

static bool is_member_name(const std::string& s){
    if(s.empty()) return false;
    if(!(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
    for(char c : s) if(!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
    return true;
}

const directive_descriptor* DefaultDirectivePass::find(const std::string& name) const {
    for(auto& d : directives_) if(d.name == name) return &d;
    return nullptr;
}

void DefaultDirectivePass::report(sprig::diagnostic_list& out, const char* id, size_t position, size_t length, std::string message){
    sprig::diagnostic d{id, sprig::span_from_offset(source_, position, length, file_path_), std::move(message)};
    diagnostics_.push_back(d);
    out.push_back(std::move(d));
}

node_ptr DefaultDirectivePass::visit_directive(const node_ptr& n){
    sprig::token_ptr name;
    std::vector<node_ptr> tokens;
    for(auto& c : n->children()){
        if(c->kind() == syntax_kind::keyword && !name) name = sprig::as_token(c);
        else if(c->kind() == syntax_kind::directive_token) tokens.push_back(c);
    }
    // A missing name was already reported by the parser.
    if(!name || name->is_missing()) return n;

    sprig::diagnostic_list found;
    const directive_descriptor* desc = find(name->content());
    if(!desc){
        report(found, unknown_directive_id, name->position(), name->full_width(),
               "Unknown directive \"" + name->content() + "\".");
    } else if(tokens.size() != desc->tokens.size()){
        report(found, directive_token_count_id, n->position(), n->full_width(),
               "The \"" + desc->name + "\" directive expects " + std::to_string(desc->tokens.size()) +
               " token(s) but " + std::to_string(tokens.size()) + " were found.");
    } else {
        for(size_t i = 0; i < tokens.size(); ++i){
            if(desc->tokens[i] != directive_token_kind::member) continue;
            std::string text = tokens[i]->to_full_string();
            if(!is_member_name(text))
                report(found, invalid_member_name_id, tokens[i]->position(), tokens[i]->full_width(),
                       "\"" + text + "\" is not a valid member name.");
        }
    }
    if(found.empty()) return n;

    sprig::diagnostic_list merged = n->get_diagnostics();
    merged.insert(merged.end(), found.begin(), found.end());
    return n->with_diagnostics(std::move(merged));
}

syntax_tree apply_default_directive_pass(syntax_tree tree){
    DefaultDirectivePass pass(tree.options.directives, tree.source, tree.file_path);
    tree.root = pass.visit(tree.root);
    tree.diagnostics.insert(tree.diagnostics.end(), pass.diagnostics().begin(), pass.diagnostics().end());
    return tree;
}

} // namespace razorlite
