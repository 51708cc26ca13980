// Source spans and diagnostics shared by the tree, passes and front ends
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace sprig {

struct source_span {
    std::string file_path;
    size_t absolute_index = 0;
    size_t line_index = 0;
    size_t character_index = 0;
    size_t length = 0;

    // (abs:line,col [len] file)
    std::string to_string() const;
};

bool operator==(const source_span& a, const source_span& b);
inline bool operator!=(const source_span& a, const source_span& b){ return !(a == b); }

enum class diagnostic_severity { error, warning };

struct diagnostic {
    std::string id;
    source_span span;
    std::string message;
    diagnostic_severity severity = diagnostic_severity::error;
};

// One line of the companion baseline file: id immediately followed by the span.
std::string serialize_diagnostic(const diagnostic& d);

using diagnostic_list = std::vector<diagnostic>;

// Span for [absolute_index, absolute_index + length) of text, with zero-based
// line and character indices computed from LF line breaks.
source_span span_from_offset(std::string_view text, size_t absolute_index, size_t length, std::string file_path = {});

} // namespace sprig
