// Immutable syntax/IR tree: nodes, tokens, trivia, annotations
#pragma once
#include "sprig/diagnostics.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sprig {

enum class syntax_kind {
    // non-terminals
    document,
    class_declaration,
    code_block,
    directive,
    directive_token,
    design_time_directive,
    field_declaration,
    markup_text,
    code_literal,
    // tokens
    keyword,
    identifier,
    whitespace,
    new_line,
    transition,
    left_brace,
    right_brace,
    semicolon,
    text,
    code,
};

const char* kind_name(syntax_kind k);
bool is_token_kind(syntax_kind k);

enum class trivia_kind { whitespace, new_line, comment };

struct trivia {
    trivia_kind kind = trivia_kind::whitespace;
    std::string text;
};

inline bool operator==(const trivia& a, const trivia& b){ return a.kind == b.kind && a.text == b.text; }
inline bool operator!=(const trivia& a, const trivia& b){ return !(a == b); }

using trivia_list = std::vector<trivia>;

enum class accepted_characters { none, any, non_whitespace, whitespace, new_line, any_except_new_line };

const char* accepted_characters_name(accepted_characters a);

struct edit_handler {
    std::string name = "SpanEditHandler";
    accepted_characters accepts = accepted_characters::any;
    // name;Accepts:<accepted>
    std::string to_string() const;
};

// Correlates a node with the code generation strategy and the incremental edit
// behaviour of the span it came from.
struct span_context {
    std::string chunk_generator;
    edit_handler handler;
};

inline constexpr const char* span_context_kind = "SpanContext";

using annotation_data = std::variant<std::string, int64_t, span_context>;
// Keyed by annotation kind; at most one payload per kind.
using annotation_map = std::map<std::string, annotation_data>;

class node;
class token;
using node_ptr = std::shared_ptr<const node>;
using token_ptr = std::shared_ptr<const token>;
using node_list = std::vector<node_ptr>;

class node : public std::enable_shared_from_this<node> {
public:
    node(syntax_kind kind, size_t position, node_list children, annotation_map annotations = {}, diagnostic_list diagnostics = {});
    virtual ~node() = default;

    syntax_kind kind() const { return kind_; }
    size_t position() const { return position_; }
    size_t full_width() const { return full_width_; }
    size_t end_position() const { return position_ + full_width_; }
    const node_list& children() const { return children_; }
    const annotation_map& get_annotations() const { return annotations_; }
    const diagnostic_list& get_diagnostics() const { return diagnostics_; }

    virtual bool is_token() const { return false; }

    const annotation_data* find_annotation(const std::string& kind) const {
        auto it = annotations_.find(kind); return it == annotations_.end() ? nullptr : &it->second;
    }
    template<typename T>
    const T* annotation_as(const std::string& kind) const {
        auto* a = find_annotation(kind); return a ? std::get_if<T>(a) : nullptr;
    }

    // Exact text of the subtree, trivia included.
    virtual std::string to_full_string() const;
    // Text without the leading trivia of the first token and trailing trivia of the last.
    virtual std::string to_string() const;

    // Derivations; the receiver is left untouched.
    virtual node_ptr with_children(node_list children) const;
    virtual node_ptr with_annotations(annotation_map annotations) const;
    virtual node_ptr with_diagnostics(diagnostic_list diagnostics) const;

protected:
    node(syntax_kind kind, size_t position, size_t full_width, annotation_map annotations, diagnostic_list diagnostics);

    syntax_kind kind_;
    size_t position_;
    size_t full_width_;
    node_list children_;
    annotation_map annotations_;
    diagnostic_list diagnostics_;
};

struct token_flags {
    bool missing = false;
    bool synthesized = false;
};

class token final : public node {
public:
    using flags = token_flags;

    token(syntax_kind kind, size_t position, std::string content, flags f = {},
          trivia_list leading = {}, trivia_list trailing = {},
          annotation_map annotations = {}, diagnostic_list diagnostics = {});

    bool is_token() const override { return true; }
    const std::string& content() const { return content_; }
    bool is_missing() const { return flags_.missing; }
    bool is_synthesized() const { return flags_.synthesized; }
    const trivia_list& leading_trivia() const { return leading_; }
    const trivia_list& trailing_trivia() const { return trailing_; }

    std::string to_full_string() const override;
    std::string to_string() const override { return content_; }

    // Tokens have no children; with_children returns the token itself.
    node_ptr with_children(node_list children) const override;
    node_ptr with_annotations(annotation_map annotations) const override;
    node_ptr with_diagnostics(diagnostic_list diagnostics) const override;
    token_ptr with_trivia(trivia_list leading, trivia_list trailing) const;

private:
    std::string content_;
    flags flags_;
    trivia_list leading_;
    trivia_list trailing_;
};

// Factories
node_ptr make_node(syntax_kind kind, size_t position, node_list children, annotation_map annotations = {}, diagnostic_list diagnostics = {});
token_ptr make_token(syntax_kind kind, size_t position, std::string content, diagnostic_list diagnostics = {},
                     trivia_list leading = {}, trivia_list trailing = {});
// Zero-width placeholder produced by error recovery.
token_ptr make_missing_token(syntax_kind kind, size_t position, diagnostic_list diagnostics = {});
// Generated text with no source range.
token_ptr make_synthesized_token(syntax_kind kind, size_t position, std::string content);

inline token_ptr as_token(const node_ptr& n){
    return (n && n->is_token()) ? std::static_pointer_cast<const token>(n) : nullptr;
}

annotation_map make_span_context_annotation(std::string chunk_generator, edit_handler handler);

// Structural deep equality. If ignore_annotations is true, annotation maps are ignored.
bool equivalent(const node_ptr& a, const node_ptr& b, bool ignore_annotations = true);

} // namespace sprig
