// Markdown and HTML backends over a parsed Document
#pragma once
#include "lmm/ast.hpp"
#include <string>

namespace lmm
{

    // 'part' blocks become headings (level = nesting depth, capped at 6),
    // 'list' blocks bullet or line lists, 'code' blocks fenced code. Other
    // blocks are transparent. Comment lines are never rendered. Trailing
    // newlines of the whole output are trimmed.
    std::string render_markdown(const Document &doc);

    // Same reserved names, wrapped in <section>/<ul>/<pre>/<div> elements with
    // attrs and params mapped to data-* and data-param-* attributes.
    std::string render_html(const Document &doc);

} // namespace lmm
