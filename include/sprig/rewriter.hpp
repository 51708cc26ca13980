#pragma once
#include "sprig/syntax.hpp"
#include <stdexcept>

namespace sprig {

// Generic traversal with optional substitution over the immutable tree.
//
// visit(n) is the single entry point:
//   - tokens go to visit_token
//   - non-terminals go to visit_<kind>, each of which defaults to visit_default
// visit_default rebuilds a node from its visited children. Children whose result
// is the identical pointer are kept; if nothing changed the original node is
// returned. A null result removes that child from the rebuilt node.
// Trivia is only visited when the rewriter is constructed with visit_into_trivia.
//
// Subclasses are responsible for returning well-shaped nodes; nothing is validated.

// A traversal leg a concrete rewriter deliberately does not support.
struct not_implemented_error : std::logic_error {
    using std::logic_error::logic_error;
};

class Rewriter {
public:
    explicit Rewriter(bool visit_into_trivia = false) : visit_into_trivia_(visit_into_trivia) {}
    virtual ~Rewriter() = default;

    virtual node_ptr visit(const node_ptr& n);
    virtual node_ptr visit_token(const token_ptr& t);
    virtual trivia visit_trivia(const trivia& t) { return t; }

    virtual node_ptr visit_document(const node_ptr& n) { return visit_default(n); }
    virtual node_ptr visit_class_declaration(const node_ptr& n) { return visit_default(n); }
    virtual node_ptr visit_code_block(const node_ptr& n) { return visit_default(n); }
    virtual node_ptr visit_directive(const node_ptr& n) { return visit_default(n); }
    virtual node_ptr visit_directive_token(const node_ptr& n) { return visit_default(n); }
    virtual node_ptr visit_design_time_directive(const node_ptr& n) { return visit_default(n); }
    virtual node_ptr visit_field_declaration(const node_ptr& n) { return visit_default(n); }
    virtual node_ptr visit_markup_text(const node_ptr& n) { return visit_default(n); }
    virtual node_ptr visit_code_literal(const node_ptr& n) { return visit_default(n); }

    bool visits_trivia() const { return visit_into_trivia_; }

protected:
    node_ptr visit_default(const node_ptr& n);

private:
    bool visit_into_trivia_;
    trivia_list visit_trivia_list(const trivia_list& list, bool& changed);
};

} // namespace sprig
