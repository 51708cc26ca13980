// Structural equality of syntax trees.
#include "sprig/syntax.hpp"

namespace sprig {

static bool equal_span_context(const span_context& a, const span_context& b){
    return a.chunk_generator == b.chunk_generator && a.handler.name == b.handler.name && a.handler.accepts == b.handler.accepts;
}

static bool equal_annotations(const annotation_map& a, const annotation_map& b){
    if (a.size() != b.size()) return false;
    for (const auto& kv : a) {
        auto it = b.find(kv.first);
        if (it == b.end()) return false;
        if (kv.second.index() != it->second.index()) return false;
        if (auto* sa = std::get_if<span_context>(&kv.second)) {
            if (!equal_span_context(*sa, std::get<span_context>(it->second))) return false;
        } else if (auto* s = std::get_if<std::string>(&kv.second)) {
            if (*s != std::get<std::string>(it->second)) return false;
        } else if (std::get<int64_t>(kv.second) != std::get<int64_t>(it->second)) {
            return false;
        }
    }
    return true;
}

static bool equal_diagnostics(const diagnostic_list& a, const diagnostic_list& b){
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i)
        if (a[i].id != b[i].id || a[i].span != b[i].span || a[i].message != b[i].message) return false;
    return true;
}

static bool equal_impl(const node_ptr& a, const node_ptr& b, bool ignore_annotations) {
    if (a.get() == b.get()) return true;
    if (!a || !b) return false;
    if (a->kind() != b->kind() || a->is_token() != b->is_token()) return false;
    if (a->position() != b->position() || a->full_width() != b->full_width()) return false;
    if (!ignore_annotations && !equal_annotations(a->get_annotations(), b->get_annotations())) return false;
    if (!equal_diagnostics(a->get_diagnostics(), b->get_diagnostics())) return false;

    if (a->is_token()) {
        auto& ta = static_cast<const token&>(*a);
        auto& tb = static_cast<const token&>(*b);
        return ta.content() == tb.content() && ta.is_missing() == tb.is_missing() && ta.is_synthesized() == tb.is_synthesized()
            && ta.leading_trivia() == tb.leading_trivia() && ta.trailing_trivia() == tb.trailing_trivia();
    }

    const auto& lc = a->children();
    const auto& rc = b->children();
    if (lc.size() != rc.size()) return false;
    for (size_t i = 0; i < lc.size(); ++i) if (!equal_impl(lc[i], rc[i], ignore_annotations)) return false;
    return true;
}

bool equivalent(const node_ptr& a, const node_ptr& b, bool ignore_annotations) {
    return equal_impl(a, b, ignore_annotations);
}

} // namespace sprig
