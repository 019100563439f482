// LMM parsing engine: source text -> Document + diagnostics
#pragma once
#include "lmm/ast.hpp"
#include <cstddef>
#include <string_view>
#include <vector>

namespace lmm
{

    // Indentation weights; only TextLine::indent depends on them.
    struct ParseOptions
    {
        size_t space_width = 1;
        size_t tab_width = 2;
    };

    struct ParseResult
    {
        Document document;
        std::vector<Diagnostic> diagnostics; // source encounter order

        size_t error_count() const;
        size_t warning_count() const;
        bool has_errors() const { return error_count() > 0; }
    };

    // Parse a whole document. Never throws on malformed input: problems are
    // reported as diagnostics next to a best-effort tree.
    ParseResult parse_document(std::string_view input);
    ParseResult parse_document(std::string_view input, const ParseOptions &options);

} // namespace lmm
