// Line-level helpers shared by the scanner: trimming, line classification,
// escape handling and weighted indentation.
#pragma once
#include "lmm/ast.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace lmm
{

    struct ParseOptions; // forward declaration (parser.hpp)

    namespace detail
    {
        inline bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v'; }

        std::string_view ltrim(std::string_view s);
        std::string_view rtrim(std::string_view s);
        std::string_view trim(std::string_view s);
        bool starts_with(std::string_view s, std::string_view prefix);

        bool is_blank_line(std::string_view line);
        // '!' after optional leading whitespace, but not the '!!' escape.
        bool is_comment_line(std::string_view line);
        // Trimmed content is exactly '$'.
        bool is_dollar_line(std::string_view line);
        // '@' after optional leading whitespace, but not the '@@' escape.
        bool starts_block_header(std::string_view s);

        // Collapse '@@', '##' and '{{' to their first character, left to right.
        std::string unescape_text(std::string_view s);

        // Sum of weights over the leading run of spaces and tabs. The number of
        // bytes in that run is stored in consumed.
        size_t weighted_indent(std::string_view s, const ParseOptions &options, size_t &consumed);

        // Position of a byte offset inside one physical line.
        Position position_in_line(size_t line_index, std::string_view line, size_t byte_offset);
        // Column 0 through the end of the line.
        Span line_span(size_t line_index, std::string_view line);
        // Zero-width span at column 0.
        Span span_at_line_start(size_t line_index);
    }

} // namespace lmm
