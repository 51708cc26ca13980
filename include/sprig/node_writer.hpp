// node_writer.hpp - deterministic text rendering of trees for snapshot baselines
#pragma once
#include "sprig/rewriter.hpp"
#include <string>

namespace llvm { class raw_ostream; }

namespace sprig {

// Writes one entry per visited node to the sink and returns the node unchanged.
// The writer never descends on its own: the caller drives the traversal and sets
// the depth before each visit. The first node written also gets the full source
// text of its subtree appended as an anchor.
//
// Non-terminal:  <indent>Kind - [start..end) - FullWidth: n[ - Gen<g> - handler][ - [full text]]
// Token:         <indent>Kind;[content];id(span), id(span)
class NodeWriter : public Rewriter {
public:
    explicit NodeWriter(llvm::raw_ostream& os, bool visit_into_trivia = false) : Rewriter(visit_into_trivia), os_(os) {}

    int depth() const { return depth_; }
    void set_depth(int d) { depth_ = d; }

    node_ptr visit(const node_ptr& n) override;
    node_ptr visit_token(const token_ptr& t) override;
    trivia visit_trivia(const trivia& t) override;

    void write_new_line();

private:
    llvm::raw_ostream& os_;
    int depth_ = 0;
    bool visited_root_ = false;

    void write_node(const node& n);
    void write_token(const token& t);
    void write_span_context(const span_context& ctx);
    void write_indent();
    void write_separator();
    void write(const std::string& value);
};

// Replaces CRLF and LF with the two-character marker "LF".
std::string normalize_new_lines(const std::string& s);

struct serialize_options {
    // Pass trivia to the writer. The writer does not support trivia, so this
    // fails on the first token that carries any.
    bool visit_trivia = false;
};

// Single pre-order pass, one line per node/token.
std::string serialize_tree(const node_ptr& root, const serialize_options& options = {});
void serialize_tree(const node_ptr& root, llvm::raw_ostream& os, const serialize_options& options = {});

} // namespace sprig
