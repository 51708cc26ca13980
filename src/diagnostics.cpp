#include "sprig/diagnostics.hpp"
#include <sstream>

namespace sprig {

std::string source_span::to_string() const {
    std::ostringstream os;
    os << '(' << absolute_index << ':' << line_index << ',' << character_index << " [" << length << "] " << file_path << ')';
    return os.str();
}

bool operator==(const source_span& a, const source_span& b){
    return a.file_path == b.file_path && a.absolute_index == b.absolute_index && a.line_index == b.line_index
        && a.character_index == b.character_index && a.length == b.length;
}

std::string serialize_diagnostic(const diagnostic& d){ return d.id + d.span.to_string(); }

source_span span_from_offset(std::string_view text, size_t absolute_index, size_t length, std::string file_path){
    source_span s;
    s.file_path = std::move(file_path);
    s.absolute_index = absolute_index;
    s.length = length;
    size_t end = absolute_index < text.size() ? absolute_index : text.size();
    for(size_t i = 0; i < end; ++i){
        if(text[i] == '\n'){ ++s.line_index; s.character_index = 0; }
        else ++s.character_index;
    }
    return s;
}

} // namespace sprig
