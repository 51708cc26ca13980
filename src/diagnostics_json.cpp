#include "sprig/diagnostics_json.hpp"
#include "sprig/env.hpp"
#include <sstream>
#include <cstdio>

#include <llvm/Support/raw_ostream.h>

namespace sprig {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

static void append_span_json(std::ostringstream& os, const source_span& s){
    os<<"{\"file\":"<<json_escape(s.file_path)
      <<",\"index\":"<<s.absolute_index
      <<",\"line\":"<<s.line_index
      <<",\"col\":"<<s.character_index
      <<",\"length\":"<<s.length
      <<"}";
}

std::string diagnostics_to_json(const diagnostic_list& diagnostics){
    size_t errors = 0;
    for(auto& d: diagnostics) if(d.severity==diagnostic_severity::error) ++errors;
    std::ostringstream os;
    os<<"{\"success\":"<<(errors==0?"true":"false")<<",\"diagnostics\":[";
    for(size_t i=0;i<diagnostics.size(); ++i){
        const auto &d=diagnostics[i]; if(i) os<<",";
        os<<"{"
            "\"id\":"<<json_escape(d.id)
            <<",\"severity\":"<<(d.severity==diagnostic_severity::error?"\"error\"":"\"warning\"")
            <<",\"message\":"<<json_escape(d.message)
            <<",\"span\":";
        append_span_json(os,d.span);
        os<<"}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const diagnostic_list& diagnostics){
    if(detect_env().diag_json){
        llvm::errs() << diagnostics_to_json(diagnostics) << "\n";
    }
}

} // namespace sprig
