#include "lmm/outline.hpp"
#include <utility>

namespace lmm
{

Symbol::~Symbol()
{
    std::vector<Symbol> work = std::move(children);
    while (!work.empty())
    {
        Symbol s = std::move(work.back());
        work.pop_back();
        for (auto &child : s.children)
            work.push_back(std::move(child));
        s.children.clear();
    }
}

namespace
{

    // Sibling list being walked plus the symbol list its parts land in.
    struct outline_frame
    {
        const std::vector<Node> *nodes;
        size_t next;
        std::vector<Symbol> *out;
    };

    std::string part_name(const Block &b)
    {
        if (b.args.empty())
            return "part";
        std::string name;
        for (size_t i = 0; i < b.args.size(); ++i)
        {
            if (i)
                name += ' ';
            name += b.args[i];
        }
        return name;
    }

} // namespace

std::vector<Symbol> outline(const Document &doc)
{
    std::vector<Symbol> out;
    std::vector<outline_frame> stack{{&doc.nodes, 0, &out}};
    while (!stack.empty())
    {
        outline_frame &top = stack.back();
        if (top.next == top.nodes->size())
        {
            stack.pop_back();
            continue;
        }
        const Block *b = as_block((*top.nodes)[top.next++]);
        if (!b)
            continue;
        if (b->name != "part")
        {
            // parts under other blocks are hoisted to this level
            stack.push_back({&b->nodes, 0, top.out});
            continue;
        }
        Symbol sym;
        sym.name = part_name(*b);
        sym.range = b->span;
        sym.selection_range = b->span;
        top.out->push_back(std::move(sym));
        std::vector<Symbol> *children = &top.out->back().children;
        stack.push_back({&b->nodes, 0, children});
    }
    return out;
}

const std::vector<Snippet> &block_snippets()
{
    static const std::vector<Snippet> snippets = {
        {"part", "section heading", "part { $1 }"},
        {"list", "bullet list", "list bullet {\n  $1\n}"},
        {"code", "code block", "code[lang=$1] {\n  $2\n}"},
        {"b", "bold text", "b {$1}"},
    };
    return snippets;
}

} // namespace lmm
