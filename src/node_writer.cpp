#include "sprig/node_writer.hpp"
#include <llvm/Support/raw_ostream.h>

namespace sprig {

std::string normalize_new_lines(const std::string& s){
    std::string out;
    out.reserve(s.size());
    for(size_t i = 0; i < s.size(); ++i){
        if(s[i] == '\r' && i + 1 < s.size() && s[i+1] == '\n'){ out += "LF"; ++i; }
        else if(s[i] == '\n') out += "LF";
        else out += s[i];
    }
    return out;
}

node_ptr NodeWriter::visit(const node_ptr& n){
    if(!n) return n;
    if(n->is_token()) return visit_token(std::static_pointer_cast<const token>(n));
    write_node(*n);
    return n;
}

node_ptr NodeWriter::visit_token(const token_ptr& t){
    write_token(*t);
    return Rewriter::visit_token(t);
}

trivia NodeWriter::visit_trivia(const trivia&){
    throw not_implemented_error("NodeWriter does not support trivia");
}

void NodeWriter::write_node(const node& n){
    write_indent();
    write(kind_name(n.kind()));
    write_separator();
    write("[" + std::to_string(n.position()) + ".." + std::to_string(n.end_position()) + ")");
    write_separator();
    write("FullWidth: " + std::to_string(n.full_width()));

    if(auto* ctx = n.annotation_as<span_context>(span_context_kind))
        write_span_context(*ctx);

    if(!visited_root_){
        write_separator();
        write("[" + n.to_full_string() + "]");
        visited_root_ = true;
    }
}

void NodeWriter::write_token(const token& t){
    write_indent();
    std::string content = t.is_missing() ? "<Missing>" : t.content();
    std::string diags;
    for(auto& d : t.get_diagnostics()){
        if(!diags.empty()) diags += ", ";
        diags += serialize_diagnostic(d);
    }
    write(std::string(kind_name(t.kind())) + ";[" + content + "];" + diags);
}

void NodeWriter::write_span_context(const span_context& ctx){
    write_separator();
    write("Gen<" + ctx.chunk_generator + ">");
    write_separator();
    write(ctx.handler.to_string());
}

void NodeWriter::write_indent(){
    for(int i = 0; i < depth_; ++i) os_ << "    ";
}

void NodeWriter::write_separator(){ write(" - "); }

void NodeWriter::write_new_line(){ os_ << '\n'; }

void NodeWriter::write(const std::string& value){ os_ << normalize_new_lines(value); }

static void serialize_impl(NodeWriter& w, const node_ptr& n, int depth){
    w.set_depth(depth);
    w.visit(n);
    w.write_new_line();
    if(n->is_token()) return;
    for(auto& ch : n->children()) serialize_impl(w, ch, depth + 1);
}

std::string serialize_tree(const node_ptr& root, const serialize_options& options){
    std::string buf;
    if(!root) return buf;
    llvm::raw_string_ostream os(buf);
    NodeWriter w(os, options.visit_trivia);
    serialize_impl(w, root, 0);
    os.flush();
    return buf;
}

// Buffered so a failing traversal leaves nothing in the sink.
void serialize_tree(const node_ptr& root, llvm::raw_ostream& os, const serialize_options& options){
    os << serialize_tree(root, options);
}

} // namespace sprig
