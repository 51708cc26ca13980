// razorlite - a small class/directive template language used to drive sprig trees
#pragma once
#include "sprig/diagnostics.hpp"
#include "sprig/rewriter.hpp"
#include "sprig/syntax.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace razorlite {

enum class directive_token_kind { type, member, namespace_name, string };

struct directive_descriptor {
    std::string name;
    std::vector<directive_token_kind> tokens;
};

// inject <type> <member>
std::vector<directive_descriptor> default_directives();

struct parse_options {
    bool design_time = false;
    std::vector<directive_descriptor> directives = default_directives();
};

struct syntax_tree {
    sprig::node_ptr root;
    // root after design-time lowering; the same node as root otherwise
    sprig::node_ptr lowered;
    sprig::diagnostic_list diagnostics;
    std::string source;
    std::string file_path;
    parse_options options;
};

// Diagnostic ids
inline constexpr const char* missing_class_name_id = "RL1001";
inline constexpr const char* missing_open_brace_id = "RL1002";
inline constexpr const char* missing_close_brace_id = "RL1003";
inline constexpr const char* parse_failure_id = "RL1999";
inline constexpr const char* unknown_directive_id = "RL2001";
inline constexpr const char* directive_token_count_id = "RL2002";
inline constexpr const char* invalid_member_name_id = "RL2003";

// Never throws for malformed input: problems come back as missing tokens plus
// diagnostics. The default directive pass has already been applied. With
// options.design_time set, the default pipeline is run as well and its result
// is stored in lowered.
syntax_tree parse_document(std::string_view source, const parse_options& options = {}, std::string_view file_path = {});

// Syntax-level validation of directives against their descriptors. Offending
// directive nodes are rebuilt with the diagnostic attached; every diagnostic is
// also appended to diagnostics().
class DefaultDirectivePass : public sprig::Rewriter {
public:
    // source must outlive the pass; diagnostic spans are computed against it.
    DefaultDirectivePass(const std::vector<directive_descriptor>& directives, std::string_view source, std::string file_path)
        : directives_(directives), source_(source), file_path_(std::move(file_path)) {}

    sprig::node_ptr visit_directive(const sprig::node_ptr& n) override;

    const sprig::diagnostic_list& diagnostics() const { return diagnostics_; }

private:
    const std::vector<directive_descriptor>& directives_;
    std::string_view source_;
    std::string file_path_;
    sprig::diagnostic_list diagnostics_;

    const directive_descriptor* find(const std::string& name) const;
    void report(sprig::diagnostic_list& out, const char* id, size_t position, size_t length, std::string message);
};

// Runs DefaultDirectivePass over tree.root, merging its diagnostics into the tree.
syntax_tree apply_default_directive_pass(syntax_tree tree);

} // namespace razorlite
