#include "sprig/verify.hpp"
#include <sstream>

namespace sprig {

static std::string describe(const node& n){
    std::ostringstream os;
    os << kind_name(n.kind()) << " [" << n.position() << ".." << n.end_position() << ")";
    return os.str();
}

static void verify_impl(const node_ptr& n, std::vector<std::string>& problems){
    if(!n){ problems.push_back("null node in tree"); return; }
    if(n->is_token()) return;
    size_t cursor = n->position();
    for(auto& ch : n->children()){
        if(!ch){ problems.push_back("null child under " + describe(*n)); continue; }
        if(ch->position() != cursor){
            std::ostringstream os;
            os << (ch->position() > cursor ? "gap" : "overlap") << " before " << describe(*ch)
               << " under " << describe(*n) << ": expected start " << cursor;
            problems.push_back(os.str());
        }
        cursor = ch->end_position();
        verify_impl(ch, problems);
    }
    if(!n->children().empty() && cursor != n->end_position()){
        std::ostringstream os;
        os << "children of " << describe(*n) << " end at " << cursor;
        problems.push_back(os.str());
    }
}

std::vector<std::string> verify_tree(const node_ptr& root){
    std::vector<std::string> problems;
    verify_impl(root, problems);
    return problems;
}

void ensure_well_formed(const node_ptr& root){
    auto problems = verify_tree(root);
    if(!problems.empty()) throw tree_verification_error("malformed tree: " + problems.front());
}

} // namespace sprig
