// Editor-facing views of a parse: document outline and block snippets
#pragma once
#include "lmm/ast.hpp"
#include <string>
#include <vector>

namespace lmm
{

    struct Symbol
    {
        std::string name;
        Span range;
        Span selection_range;
        std::vector<Symbol> children;

        Symbol() = default;
        Symbol(const Symbol &) = default;
        Symbol(Symbol &&) = default;
        Symbol &operator=(const Symbol &) = default;
        Symbol &operator=(Symbol &&) = default;
        ~Symbol(); // flattens children first; outlines may be very deep
    };

    // Nested symbols for 'part' blocks. Parts found under other blocks are
    // hoisted to the nearest enclosing level.
    std::vector<Symbol> outline(const Document &doc);

    struct Snippet
    {
        std::string label;
        std::string detail;
        std::string insert_text; // snippet syntax with $1, $2 tab stops
    };

    const std::vector<Snippet> &block_snippets();

} // namespace lmm
