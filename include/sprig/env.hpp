#pragma once
#include <string>

namespace sprig {

struct env_config {
    bool trace = false;              // log pass execution to stderr
    bool verify_trees = false;       // check the range invariant before running passes
    bool diag_json = false;          // dump diagnostics as JSON to stderr
    bool generate_baselines = false; // rewrite baselines instead of comparing
    std::string baseline_root;       // empty = use the caller's default
};

// Detect configuration from process env vars:
//   SPRIG_TRACE=1, SPRIG_VERIFY_TREES=1, SPRIG_DIAG_JSON=1,
//   SPRIG_GENERATE_BASELINES=1, SPRIG_BASELINE_ROOT=<dir>
env_config detect_env();

} // namespace sprig
