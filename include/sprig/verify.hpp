#pragma once
#include "sprig/syntax.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace sprig {

struct tree_verification_error : std::logic_error {
    using std::logic_error::logic_error;
};

// Checks the range invariant of a source-derived tree: the children of every
// non-terminal start at the parent's position, are contiguous and end at the
// parent's end position. Returns one message per violation, in pre-order.
std::vector<std::string> verify_tree(const node_ptr& root);

// Throws tree_verification_error carrying the first violation.
void ensure_well_formed(const node_ptr& root);

} // namespace sprig
