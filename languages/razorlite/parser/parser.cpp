#include "razorlite/razorlite.hpp"
#include "grammar.hpp"
#include "sprig/pass.hpp"

#include <tao/pegtl.hpp>

namespace razorlite {

using sprig::accepted_characters;
using sprig::edit_handler;
using sprig::node_list;
using sprig::node_ptr;
using sprig::syntax_kind;

namespace {

const char* markup_generator = "Markup";
const char* statement_generator = "Statement";
const char* directive_token_generator = "DirectiveToken";

// One open non-terminal while parsing. Literal tokens are buffered in
// `pending` and flushed into a single MarkupText/CodeLiteral child whenever a
// structural child starts or the frame closes.
struct frame {
    syntax_kind kind;
    size_t position;
    node_list children;
    node_list pending;
    std::string name;
};

struct build_state {
    std::string_view source;
    std::string file_path;
    std::vector<frame> frames;
    sprig::diagnostic_list diagnostics;

    frame& current(){ return frames.back(); }

    void flush(){
        frame& f = current();
        if(f.pending.empty()) return;
        size_t pos = f.pending.front()->position();
        if(f.kind == syntax_kind::document){
            f.children.push_back(sprig::make_node(syntax_kind::markup_text, pos, std::move(f.pending),
                sprig::make_span_context_annotation(markup_generator, edit_handler{"SpanEditHandler", accepted_characters::any})));
        } else {
            f.children.push_back(sprig::make_node(syntax_kind::code_literal, pos, std::move(f.pending),
                sprig::make_span_context_annotation(statement_generator, edit_handler{"SpanEditHandler", accepted_characters::any})));
        }
        f.pending.clear();
    }

    void literal(syntax_kind kind, size_t pos, std::string text){
        current().pending.push_back(sprig::make_token(kind, pos, std::move(text)));
    }

    void add(node_ptr n){
        flush();
        current().children.push_back(std::move(n));
    }

    void open(syntax_kind kind, size_t pos){
        flush();
        frames.push_back(frame{kind, pos, {}, {}, {}});
    }

    void close(sprig::annotation_map annotations = {}){
        flush();
        frame f = std::move(frames.back());
        frames.pop_back();
        current().children.push_back(sprig::make_node(f.kind, f.position, std::move(f.children), std::move(annotations)));
    }

    void missing(syntax_kind kind, size_t pos, const char* id, std::string message){
        sprig::diagnostic d{id, sprig::span_from_offset(source, pos, 0, file_path), std::move(message)};
        diagnostics.push_back(d);
        add(sprig::make_missing_token(kind, pos, {std::move(d)}));
    }
};

template<typename Input>
size_t offset(const Input& in){ return static_cast<size_t>(in.position().byte); }

template<syntax_kind Kind>
struct literal_action {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.literal(Kind, offset(in), in.string()); }
};

template<syntax_kind Kind>
struct token_action {
    template<typename Input>
    static void apply(const Input& in, build_state& st){ st.add(sprig::make_token(Kind, offset(in), in.string())); }
};

template<typename Rule>
struct action : tao::pegtl::nothing<Rule> {};

// markup
template<> struct action< grammar::markup_ws > : literal_action< syntax_kind::whitespace > {};
template<> struct action< grammar::markup_nl > : literal_action< syntax_kind::new_line > {};
template<> struct action< grammar::markup_word > : literal_action< syntax_kind::text > {};
template<> struct action< grammar::markup_text > : literal_action< syntax_kind::text > {};
template<> struct action< grammar::markup_any > : literal_action< syntax_kind::text > {};

// code inside classes and blocks
template<> struct action< grammar::code_ws > : literal_action< syntax_kind::whitespace > {};
template<> struct action< grammar::code_nl > : literal_action< syntax_kind::new_line > {};
template<> struct action< grammar::code_word > : literal_action< syntax_kind::identifier > {};
template<> struct action< grammar::code_text > : literal_action< syntax_kind::text > {};
template<> struct action< grammar::code_any > : literal_action< syntax_kind::text > {};

// class declarations
template<>
struct action< grammar::class_keyword > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.open(syntax_kind::class_declaration, offset(in));
        st.add(sprig::make_token(syntax_kind::keyword, offset(in), in.string()));
    }
};
template<> struct action< grammar::header_ws > : token_action< syntax_kind::whitespace > {};
template<> struct action< grammar::header_nl > : token_action< syntax_kind::new_line > {};
template<>
struct action< grammar::class_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.current().name = in.string();
        st.add(sprig::make_token(syntax_kind::identifier, offset(in), in.string()));
    }
};
template<>
struct action< grammar::class_name_missing > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.missing(syntax_kind::identifier, offset(in), missing_class_name_id, "Expected a class name after \"class\".");
    }
};
template<> struct action< grammar::class_open > : token_action< syntax_kind::left_brace > {};
template<>
struct action< grammar::class_open_missing > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.missing(syntax_kind::left_brace, offset(in), missing_open_brace_id,
                   "The class \"" + st.current().name + "\" is missing an opening \"{\" character.");
    }
};
template<>
struct action< grammar::class_close > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.add(sprig::make_token(syntax_kind::right_brace, offset(in), in.string()));
        st.close();
    }
};
template<>
struct action< grammar::class_close_missing > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.missing(syntax_kind::right_brace, offset(in), missing_close_brace_id,
                   "The class \"" + st.current().name + "\" is missing a closing \"}\" character.");
        st.close();
    }
};

// nested code blocks
template<>
struct action< grammar::block_open > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.open(syntax_kind::code_block, offset(in));
        st.add(sprig::make_token(syntax_kind::left_brace, offset(in), in.string()));
    }
};
template<>
struct action< grammar::block_close > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.add(sprig::make_token(syntax_kind::right_brace, offset(in), in.string()));
        st.close();
    }
};
template<>
struct action< grammar::block_close_missing > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.missing(syntax_kind::right_brace, offset(in), missing_close_brace_id,
                   "The code block is missing a closing \"}\" character.");
        st.close();
    }
};

// directives
template<>
struct action< grammar::transition > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.open(syntax_kind::directive, offset(in));
        st.add(sprig::make_token(syntax_kind::transition, offset(in), in.string()));
    }
};
template<>
struct action< grammar::directive_name > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.current().name = in.string();
        st.add(sprig::make_token(syntax_kind::keyword, offset(in), in.string()));
    }
};
template<>
struct action< grammar::directive_name_missing > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        st.missing(syntax_kind::keyword, offset(in), unknown_directive_id, "Expected a directive name after \"@\".");
    }
};
template<> struct action< grammar::directive_ws > : token_action< syntax_kind::whitespace > {};
template<>
struct action< grammar::directive_token_text > {
    template<typename Input>
    static void apply(const Input& in, build_state& st){
        size_t pos = offset(in);
        st.add(sprig::make_node(syntax_kind::directive_token, pos,
                                {sprig::make_token(syntax_kind::text, pos, in.string())},
                                sprig::make_span_context_annotation(directive_token_generator,
                                    edit_handler{"SpanEditHandler", accepted_characters::non_whitespace})));
    }
};
template<> struct action< grammar::directive_end > : token_action< syntax_kind::semicolon > {};
template<>
struct action< grammar::directive_close > {
    template<typename Input>
    static void apply(const Input&, build_state& st){
        std::string gen = "Directive:{" + st.current().name + "}";
        st.close(sprig::make_span_context_annotation(std::move(gen),
                     edit_handler{"DirectiveEditHandler", accepted_characters::none}));
    }
};

} // namespace

syntax_tree parse_document(std::string_view source, const parse_options& options, std::string_view file_path){
    syntax_tree tree;
    tree.source = std::string(source);
    tree.file_path = std::string(file_path);
    tree.options = options;

    build_state st;
    st.source = tree.source;
    st.file_path = tree.file_path;
    st.frames.push_back(frame{syntax_kind::document, 0, {}, {}, {}});
    try {
        tao::pegtl::memory_input in(tree.source, tree.file_path.empty() ? std::string("<memory>") : tree.file_path);
        if(!tao::pegtl::parse< grammar::document, action >(in, st))
            throw tao::pegtl::parse_error("unrecognized input", in);
    } catch (const tao::pegtl::parse_error& e) {
        // Recovery: the whole source becomes one markup span.
        size_t pos = e.positions().empty() ? 0 : static_cast<size_t>(e.positions().front().byte);
        st.frames.clear();
        st.frames.push_back(frame{syntax_kind::document, 0, {}, {}, {}});
        st.diagnostics.push_back(sprig::diagnostic{parse_failure_id, sprig::span_from_offset(tree.source, pos, 0, tree.file_path),
                                                   e.what()});
        if(!tree.source.empty()) st.literal(syntax_kind::text, 0, tree.source);
    }

    st.flush();
    tree.root = sprig::make_node(syntax_kind::document, 0, std::move(st.frames.front().children));
    tree.diagnostics = std::move(st.diagnostics);
    tree = apply_default_directive_pass(std::move(tree));

    tree.lowered = tree.root;
    if(options.design_time){
        sprig::code_document doc{tree.source, tree.file_path, sprig::document_options{true}, {}};
        tree.lowered = sprig::default_pipeline(doc.options).run(doc, tree.root);
        tree.diagnostics.insert(tree.diagnostics.end(), doc.diagnostics.begin(), doc.diagnostics.end());
    }
    return tree;
}

} // namespace razorlite
