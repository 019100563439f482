// Document tree for LMM sources: positions, spans, diagnostics and nodes
#pragma once
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace lmm
{

    // Zero-based line plus the same column in three units: UTF-8 bytes,
    // UTF-16 code units and Unicode scalar values.
    struct Position
    {
        size_t line = 0;
        size_t col8 = 0;
        size_t col16 = 0;
        size_t col32 = 0;
    };

    inline bool operator==(const Position &a, const Position &b)
    {
        return a.line == b.line && a.col8 == b.col8 && a.col16 == b.col16 && a.col32 == b.col32;
    }
    inline bool operator!=(const Position &a, const Position &b) { return !(a == b); }

    // Half-open range, end exclusive. May cover several lines.
    struct Span
    {
        Position start;
        Position end;
    };

    inline bool operator==(const Span &a, const Span &b) { return a.start == b.start && a.end == b.end; }
    inline bool operator!=(const Span &a, const Span &b) { return !(a == b); }

    enum class Severity
    {
        Error,
        Warning
    };

    const char *to_string(Severity s);

    struct Diagnostic
    {
        Span span;
        Severity severity = Severity::Error;
        std::string message;
    };

    struct Attribute
    {
        std::string key;
        std::string value;
        Span span;
    };

    struct TextLine
    {
        size_t indent = 0; // weighted leading whitespace
        std::string value; // unescaped, stripped
        Span span;
        bool is_comment = false;
    };

    struct Text
    {
        std::vector<TextLine> lines;
    };

    struct Node; // forward declaration

    struct Block
    {
        std::string name;
        std::vector<std::string> args;
        std::vector<Attribute> params; // share the header span
        std::vector<Attribute> attrs;
        std::vector<Node> nodes;
        Span span; // '@' through the matched '{'

        Block() = default;
        Block(const Block &) = default;
        Block(Block &&) = default;
        Block &operator=(const Block &) = default;
        Block &operator=(Block &&) = default;
        // Releases descendants through a worklist, so nesting depth is not
        // bounded by the call stack.
        ~Block();
    };

    using node_data = std::variant<Block, Text>;

    struct Node
    {
        node_data data;
    };

    struct Document
    {
        std::vector<Attribute> attrs;
        std::vector<Node> nodes;
    };

    inline bool is_block(const Node &n) { return std::holds_alternative<Block>(n.data); }
    inline bool is_text(const Node &n) { return std::holds_alternative<Text>(n.data); }
    inline const Block *as_block(const Node &n) { return is_block(n) ? &std::get<Block>(n.data) : nullptr; }
    inline const Text *as_text(const Node &n) { return is_text(n) ? &std::get<Text>(n.data) : nullptr; }

    // Structural deep equality. With ignore_spans the comparison only looks at
    // names, arguments, attributes and text content.
    bool equal(const Document &a, const Document &b, bool ignore_spans = true);
    bool equal(const Node &a, const Node &b, bool ignore_spans = true);

    // Indented tree listing used for debug output and test messages.
    std::string to_string(const Document &d);
    std::string to_string(const Node &n);
    std::string to_string(const Span &s);

} // namespace lmm
