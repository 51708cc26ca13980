#include "sprig/design_time_pass.hpp"

namespace sprig {

std::string DesignTimeDirectivePass::helper_declaration(){
    return std::string("private static System.Object ") + design_time_variable + " = null;";
}

node_ptr DesignTimeDirectivePass::execute_core(code_document&, const node_ptr& tree){
    DesignTimeHelperWalker walker;
    return walker.visit(tree);
}

static bool is_lowered(const node_ptr& cls){
    auto& kids = cls->children();
    return kids.size() >= 2 && kids[0]->kind() == syntax_kind::design_time_directive
        && kids[1]->kind() == syntax_kind::field_declaration;
}

node_ptr DesignTimeHelperWalker::visit_class_declaration(const node_ptr& n){
    scopes_.emplace_back();
    node_ptr body = visit_default(n);
    node_list directives = std::move(scopes_.back());
    scopes_.pop_back();

    // Already lowered: leftover directive tokens join the existing holder.
    if(is_lowered(body)){
        if(directives.empty()) return body;
        const node_ptr& old_holder = body->children()[0];
        node_list hoisted = old_holder->children();
        hoisted.insert(hoisted.end(), directives.begin(), directives.end());
        size_t holder_pos = old_holder->children().empty() ? hoisted.front()->position() : old_holder->position();
        node_list children = body->children();
        children[0] = make_node(syntax_kind::design_time_directive, holder_pos, std::move(hoisted));
        return body->with_children(std::move(children));
    }

    size_t holder_pos = directives.empty() ? n->position() : directives.front()->position();
    auto holder = make_node(syntax_kind::design_time_directive, holder_pos, std::move(directives));
    auto field = make_node(syntax_kind::field_declaration, n->position(),
                           { make_synthesized_token(syntax_kind::code, n->position(), DesignTimeDirectivePass::helper_declaration()) });

    node_list children;
    children.reserve(body->children().size() + 2);
    children.push_back(std::move(holder));
    children.push_back(std::move(field));
    for(auto& ch : body->children()) children.push_back(ch);
    return body->with_children(std::move(children));
}

// Hoisted tokens stay where they are on a second run.
node_ptr DesignTimeHelperWalker::visit_design_time_directive(const node_ptr& n){ return n; }

node_ptr DesignTimeHelperWalker::visit_directive_token(const node_ptr& n){
    // Outside any class declaration there is nowhere to hoist to.
    if(scopes_.empty()) return n;
    scopes_.back().push_back(n);
    return nullptr;
}

} // namespace sprig
