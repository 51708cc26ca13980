#pragma once
#include "sprig/pass.hpp"
#include "sprig/rewriter.hpp"

#include <vector>

namespace sprig {

// Design-time lowering. Every class declaration gets two synthesized leading
// children: a design_time_directive node holding all directive tokens of the
// class (moved out of their original place, in encounter order) followed by a
// field declaration of a reserved, always-null variable. Nested classes collect
// their own directive tokens. A class that already starts with a holder and a
// field is not restructured again, so the pass is idempotent.
//
// The holder is positioned at its first hoisted token and its width is the sum
// of the hoisted widths; the tokens keep their original positions, so the
// holder's range is nominal.
//
// Must run before any other pass that classifies directive tokens.
class DesignTimeDirectivePass : public IntermediatePass {
public:
    static constexpr const char* design_time_variable = "__o";
    static constexpr int pass_order = -10;

    int order() const override { return pass_order; }
    std::string name() const override { return "design-time-directive"; }

    // private static System.Object __o = null;
    static std::string helper_declaration();

protected:
    node_ptr execute_core(code_document& document, const node_ptr& tree) override;
};

class DesignTimeHelperWalker : public Rewriter {
public:
    node_ptr visit_class_declaration(const node_ptr& n) override;
    node_ptr visit_directive_token(const node_ptr& n) override;
    node_ptr visit_design_time_directive(const node_ptr& n) override;

private:
    // One accumulator per enclosing class declaration, innermost last.
    std::vector<node_list> scopes_;
};

} // namespace sprig
