// Forward-only scan cursor over LMM source text
#pragma once
#include "lmm/ast.hpp"
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace lmm
{
    namespace detail
    {
        // One decoded UTF-8 scalar. Malformed input decodes as a single byte
        // that counts as one UTF-16 unit and one scalar.
        struct utf8_char
        {
            char32_t cp = 0;
            size_t len8 = 1;
            size_t len16 = 1;
        };

        inline bool is_continuation(unsigned char b) { return (b & 0xC0) == 0x80; }

        inline utf8_char decode_utf8(std::string_view s, size_t i)
        {
            utf8_char out;
            const unsigned char b0 = static_cast<unsigned char>(s[i]);
            out.cp = b0;
            size_t need = 0;
            char32_t cp = 0;
            if (b0 < 0x80)
                return out;
            if (b0 >= 0xC2 && b0 <= 0xDF)
            {
                need = 1;
                cp = b0 & 0x1F;
            }
            else if (b0 >= 0xE0 && b0 <= 0xEF)
            {
                need = 2;
                cp = b0 & 0x0F;
            }
            else if (b0 >= 0xF0 && b0 <= 0xF4)
            {
                need = 3;
                cp = b0 & 0x07;
            }
            else
            {
                out.cp = 0xFFFD;
                return out;
            }
            if (i + need >= s.size())
            {
                out.cp = 0xFFFD;
                return out;
            }
            for (size_t k = 1; k <= need; ++k)
            {
                const unsigned char b = static_cast<unsigned char>(s[i + k]);
                if (!is_continuation(b))
                {
                    out.cp = 0xFFFD;
                    return out;
                }
                cp = (cp << 6) | (b & 0x3F);
            }
            // overlong three-byte forms and surrogates
            if ((need == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) || (need == 3 && (cp < 0x10000 || cp > 0x10FFFF)))
            {
                out.cp = 0xFFFD;
                return out;
            }
            out.cp = cp;
            out.len8 = need + 1;
            out.len16 = cp >= 0x10000 ? 2 : 1;
            return out;
        }

        // Byte index plus the derived Position. Every movement funnels through
        // advance_char so the three column counters never drift apart.
        struct cursor
        {
            std::string_view d;
            size_t p = 0;
            size_t line_start = 0;
            Position pos;

            explicit cursor(std::string_view s) : d(s) {}

            bool eof() const { return p >= d.size(); }
            char peek() const { return eof() ? '\0' : d[p]; }
            bool at_line_start() const { return p == line_start; }

            size_t line_end() const
            {
                if (line_start >= d.size())
                    return d.size();
                auto nl = d.find('\n', line_start);
                return nl == std::string_view::npos ? d.size() : nl;
            }
            // Current physical line without its '\n'.
            std::string_view line() const
            {
                if (line_start >= d.size())
                    return std::string_view();
                return d.substr(line_start, line_end() - line_start);
            }
            std::string_view rest_of_line() const
            {
                auto end = line_end();
                return p >= end ? std::string_view() : d.substr(p, end - p);
            }
            size_t offset_in_line() const { return p - line_start; }

            void advance_char()
            {
                if (eof())
                    return;
                const char c = d[p];
                if (c == '\n')
                {
                    ++p;
                    ++pos.line;
                    pos.col8 = 0;
                    pos.col16 = 0;
                    pos.col32 = 0;
                    line_start = p;
                    return;
                }
                auto ch = decode_utf8(d, p);
                p += ch.len8;
                pos.col8 += ch.len8;
                pos.col16 += ch.len16;
                pos.col32 += 1;
            }
            void advance_to(size_t target)
            {
                if (target > d.size())
                    target = d.size();
                while (p < target)
                    advance_char();
            }
            // Skip the rest of the current line and its '\n'.
            void advance_line()
            {
                advance_to(line_end());
                if (peek() == '\n')
                    advance_char();
            }
        };
    }

} // namespace lmm
