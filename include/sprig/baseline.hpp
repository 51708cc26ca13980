// baseline.hpp - record and compare structural snapshots of trees
#pragma once
#include "sprig/diagnostics.hpp"
#include "sprig/syntax.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace sprig {

// Per-test context, passed explicitly by the caller.
struct baseline_context {
    std::string file_name;           // base name, e.g. "Parser/ClassWithDirectives"
    bool is_theory = false;          // parameterized tests cannot own a baseline
    bool generate_baselines = false; // write instead of compare
    std::string root;                // directory holding the baselines
};

// Fills generate_baselines and root from SPRIG_GENERATE_BASELINES / SPRIG_BASELINE_ROOT,
// falling back to default_root.
baseline_context make_baseline_context(std::string file_name, std::string default_root);

struct baseline_mismatch : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::string syntax_tree_baseline_path(const baseline_context& ctx);
std::string diagnostics_baseline_path(const baseline_context& ctx);

// Splits on CR and LF, dropping empty lines.
std::vector<std::string> split_baseline_lines(const std::string& text);

// Generation mode: writes <file>.syntaxtree.txt and <file>.diagnostics.txt (one
// "<id><span>" per line). With no diagnostics a stale diagnostics file is removed.
// Comparison mode: throws baseline_mismatch naming the first differing line.
// Throws std::logic_error when called without a file name or from a theory.
void assert_matches_baseline(const baseline_context& ctx, const node_ptr& root, const diagnostic_list& diagnostics);

} // namespace sprig
