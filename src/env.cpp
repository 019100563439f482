#include "lmm/env.hpp"
#include <cstdlib>
#include <cstdio>

namespace lmm {

namespace {

const char* get(const char* k){ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; }

// Whole-string unsigned parse; a sign or trailing junk rejects the value.
bool parse_width(const char* name, const char* v, size_t& out){
    if(v[0] == '-' || v[0] == '+'){ std::fprintf(stderr, "[warn] %s=%s ignored (not a non-negative integer)\n", name, v); return false; }
    char* end = nullptr;
    unsigned long long n = std::strtoull(v, &end, 10);
    if(end == v || *end != '\0'){ std::fprintf(stderr, "[warn] %s=%s ignored (not a non-negative integer)\n", name, v); return false; }
    out = static_cast<size_t>(n);
    return true;
}

} // namespace

bool env_flag_enabled(const char* name){
    const char* v = get(name);
    if(!v) return false;
    switch(v[0]){
        case '1': case 't': case 'T': case 'y': case 'Y': return true;
        default: return false;
    }
}

ParseOptions options_from_env(){
    ParseOptions o{};
    if (const char* v = get("LMM_SPACE_WIDTH")) { size_t n; if (parse_width("LMM_SPACE_WIDTH", v, n)) o.space_width = n; }
    if (const char* v = get("LMM_TAB_WIDTH")) { size_t n; if (parse_width("LMM_TAB_WIDTH", v, n)) o.tab_width = n; }
    return o;
}

} // namespace lmm
