// Markdown backend
#include "lmm/render.hpp"
#include "render_common.hpp"
#include <variant>

namespace lmm {
using namespace render_detail;

namespace {

void render_text(const Text& text, TextMode mode, std::string& out){
    if(mode != TextMode::Plain){
        for(auto& line: text.lines){
            if(line.is_comment) continue;
            if(mode == TextMode::BulletItems) out += "- ";
            out += line.value;
            out += '\n';
        }
        return;
    }
    for(auto& line: text.lines){
        if(line.is_comment) continue;
        out.append(line.indent, ' ');
        out += line.value;
        out += '\n';
    }
    out += '\n';
}

bool has_item_text(const Block& list){
    for(auto& n: list.nodes)
        if(const Text* t = as_text(n))
            for(auto& line: t->lines)
                if(!line.is_comment) return true;
    return false;
}

// Only direct text children, unescaped, one per output line.
void render_code(const Block& b, std::string& out){
    out += "```";
    out += param_value(b, "lang");
    out += '\n';
    for(auto& n: b.nodes){
        const Text* t = as_text(n);
        if(!t) continue;
        for(auto& line: t->lines){
            if(line.is_comment) continue;
            out += line.value;
            out += '\n';
        }
    }
    out += "```\n\n";
}

void render_block(const Block& b, size_t part_level, std::string& out, std::vector<render_task>& work){
    if(b.name == "part"){
        out.append(heading_level(part_level), '#');
        out += ' ';
        out += part_title(b);
        out += "\n\n";
        push_children(work, b.nodes, part_level + 1, TextMode::Plain);
    } else if(b.name == "list"){
        // nested blocks inside a list start their headings over at level 1
        if(has_item_text(b)) push_tail(work, "\n");
        push_children(work, b.nodes, 0, item_mode(b));
    } else if(b.name == "code"){
        render_code(b, out);
    } else {
        push_children(work, b.nodes, part_level, TextMode::Plain);
    }
}

} // namespace

std::string render_markdown(const Document& doc){
    std::string out;
    std::vector<render_task> work;
    push_children(work, doc.nodes, 0, TextMode::Plain);
    while(!work.empty()){
        render_task task = work.back();
        work.pop_back();
        if(!task.node){ out += task.tail; continue; }
        if(const Text* t = as_text(*task.node)) render_text(*t, task.mode, out);
        else render_block(std::get<Block>(task.node->data), task.part_level, out, work);
    }
    while(!out.empty() && out.back() == '\n') out.pop_back();
    return out;
}

} // namespace lmm
