#include "sprig/env.hpp"
#include <cstdlib>
#include <string>

namespace sprig {

// Reads process env vars and constructs an env_config.
env_config detect_env(){
    env_config e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    auto flag = [&](const char* k){ const char* v = get(k); return v && std::string(v) == "1"; };

    e.trace = flag("SPRIG_TRACE");
    e.verify_trees = flag("SPRIG_VERIFY_TREES");
    e.diag_json = flag("SPRIG_DIAG_JSON");
    e.generate_baselines = flag("SPRIG_GENERATE_BASELINES");
    if (const char* v = get("SPRIG_BASELINE_ROOT")) e.baseline_root = v;

    return e;
}

} // namespace sprig
