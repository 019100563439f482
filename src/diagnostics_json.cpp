#include "lmm/diagnostics_json.hpp"
#include "lmm/env.hpp"
#include <sstream>
#include <cstdio>

namespace lmm {

std::string json_escape(const std::string& s){
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for(char c: s){
        const char* named = nullptr;
        switch(c){
            case '"': named = "\\\""; break;
            case '\\': named = "\\\\"; break;
            case '\b': named = "\\b"; break;
            case '\f': named = "\\f"; break;
            case '\n': named = "\\n"; break;
            case '\r': named = "\\r"; break;
            case '\t': named = "\\t"; break;
            default: break;
        }
        if(named){ out += named; continue; }
        const auto u = static_cast<unsigned char>(c);
        if(u < 0x20){
            // remaining control characters have no short form
            char buf[7];
            std::snprintf(buf, sizeof(buf), "\\u%04x", u);
            out += buf;
        } else {
            out += c;
        }
    }
    out += '"';
    return out;
}

static void append_position_json(std::ostringstream& os, const Position& p){
    os<<"{\"line\":"<<p.line<<",\"character\":"<<p.col16<<"}";
}

// 1 = error, 2 = warning, matching editor protocol severities.
static int severity_code(Severity s){ return s==Severity::Error ? 1 : 2; }

std::string diagnostics_to_json(const ParseResult& r){
    std::ostringstream os;
    os<<"{\"success\":"<<(r.has_errors()?"false":"true")<<",\"diagnostics\":[";
    for(size_t i=0;i<r.diagnostics.size(); ++i){
        const auto &d=r.diagnostics[i]; if(i) os<<",";
        os<<"{"
            "\"severity\":"<<severity_code(d.severity)
            <<",\"message\":"<<json_escape(d.message)
            <<",\"source\":\"lmm\""
            <<",\"range\":{\"start\":";
        append_position_json(os,d.span.start);
        os<<",\"end\":";
        append_position_json(os,d.span.end);
        os<<"}}";
    }
    os<<"]}";
    return os.str();
}

void maybe_print_json(const ParseResult& r){
    if(env_flag_enabled("LMM_DIAG_JSON")){
        auto js=diagnostics_to_json(r);
        std::fprintf(stderr, "%s\n", js.c_str());
    }
}

} // namespace lmm
