#include "lmm/text.hpp"
#include "lmm/cursor.hpp"
#include "lmm/parser.hpp"

namespace lmm {
namespace detail {

std::string_view ltrim(std::string_view s){
    size_t i = 0;
    while(i < s.size() && is_space(s[i])) ++i;
    return s.substr(i);
}

std::string_view rtrim(std::string_view s){
    size_t n = s.size();
    while(n > 0 && is_space(s[n-1])) --n;
    return s.substr(0, n);
}

std::string_view trim(std::string_view s){ return rtrim(ltrim(s)); }

bool starts_with(std::string_view s, std::string_view prefix){
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool is_blank_line(std::string_view line){ return trim(line).empty(); }

bool is_comment_line(std::string_view line){
    auto t = ltrim(line);
    return starts_with(t, "!") && !starts_with(t, "!!");
}

bool is_dollar_line(std::string_view line){ return trim(line) == "$"; }

bool starts_block_header(std::string_view s){
    auto t = ltrim(s);
    return starts_with(t, "@") && !starts_with(t, "@@");
}

std::string unescape_text(std::string_view s){
    std::string out;
    out.reserve(s.size());
    for(size_t i = 0; i < s.size(); ++i){
        char c = s[i];
        if(i + 1 < s.size() && s[i+1] == c && (c == '@' || c == '#' || c == '{')){
            out += c;
            ++i; // the pair is consumed as a unit
            continue;
        }
        out += c;
    }
    return out;
}

size_t weighted_indent(std::string_view s, const ParseOptions& options, size_t& consumed){
    size_t indent = 0;
    consumed = 0;
    while(consumed < s.size()){
        char c = s[consumed];
        if(c == ' ') indent += options.space_width;
        else if(c == '\t') indent += options.tab_width;
        else break;
        ++consumed;
    }
    return indent;
}

Position position_in_line(size_t line_index, std::string_view line, size_t byte_offset){
    Position pos; pos.line = line_index;
    if(byte_offset > line.size()) byte_offset = line.size();
    size_t i = 0;
    while(i < byte_offset){
        auto ch = decode_utf8(line, i);
        i += ch.len8;
        pos.col8 += ch.len8;
        pos.col16 += ch.len16;
        pos.col32 += 1;
    }
    return pos;
}

Span line_span(size_t line_index, std::string_view line){
    Span s;
    s.start.line = line_index;
    s.end = position_in_line(line_index, line, line.size());
    return s;
}

Span span_at_line_start(size_t line_index){
    Span s;
    s.start.line = line_index;
    s.end.line = line_index;
    return s;
}

} // namespace detail
} // namespace lmm
