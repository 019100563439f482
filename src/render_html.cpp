// HTML backend
#include "lmm/render.hpp"
#include "render_common.hpp"
#include <variant>

namespace lmm {
using namespace render_detail;

namespace {

void push_data_attrs(std::string& out, const std::vector<Attribute>& attrs, const char* prefix){
    for(auto& a: attrs){
        auto key = sanitize_html_ident(a.key);
        if(key.empty()) continue;
        out += ' ';
        out += prefix;
        out += key;
        out += "=\"";
        escape_html_into(out, a.value);
        out += '"';
    }
}

// Opening tag with the block's attrs and params as data attributes.
void open_tag(std::string& out, const char* tag, const std::string& cls, const Block& b){
    out += '<';
    out += tag;
    out += " class=\"";
    out += cls;
    out += '"';
    push_data_attrs(out, b.attrs, "data-");
    push_data_attrs(out, b.params, "data-param-");
    out += '>';
}

void render_text(const Text& text, TextMode mode, std::string& out){
    const char* open = "<p>";
    const char* close = "</p>\n";
    if(mode == TextMode::BulletItems){ open = "<li>"; close = "</li>\n"; }
    else if(mode == TextMode::LineItems){ open = "<div class=\"lmm-line\">"; close = "</div>\n"; }
    for(auto& line: text.lines){
        if(line.is_comment) continue;
        out += open;
        escape_html_into(out, line.value);
        out += close;
    }
}

void render_code(const Block& b, std::string& out){
    auto lang = param_value(b, "lang");
    open_tag(out, "pre", "lmm-code", b);
    out += "<code";
    if(!lang.empty()){
        out += " class=\"language-";
        escape_html_into(out, lang);
        out += '"';
    }
    out += '>';
    for(auto& n: b.nodes){
        const Text* t = as_text(n);
        if(!t) continue;
        for(auto& line: t->lines){
            if(line.is_comment) continue;
            escape_html_into(out, line.value);
            out += '\n';
        }
    }
    out += "</code></pre>\n";
}

void render_block(const Block& b, size_t part_level, std::string& out, std::vector<render_task>& work){
    if(b.name == "part"){
        const size_t level = heading_level(part_level);
        open_tag(out, "section", "lmm-part", b);
        out += "\n<h" + std::to_string(level) + '>';
        escape_html_into(out, part_title(b));
        out += "</h" + std::to_string(level) + ">\n";
        push_tail(work, "</section>\n");
        push_children(work, b.nodes, part_level + 1, TextMode::Plain);
    } else if(b.name == "list"){
        const TextMode mode = item_mode(b);
        if(mode == TextMode::BulletItems){
            open_tag(out, "ul", "lmm-list", b);
            push_tail(work, "</ul>\n");
        } else {
            open_tag(out, "div", "lmm-lines", b);
            push_tail(work, "</div>\n");
        }
        out += '\n';
        push_children(work, b.nodes, 0, mode);
    } else if(b.name == "code"){
        render_code(b, out);
    } else {
        open_tag(out, "div", "lmm-block lmm-block-" + sanitize_html_ident(b.name), b);
        out += '\n';
        push_tail(work, "</div>\n");
        push_children(work, b.nodes, part_level, TextMode::Plain);
    }
}

} // namespace

std::string render_html(const Document& doc){
    std::string out = "<div class=\"lmm-document\"";
    push_data_attrs(out, doc.attrs, "data-");
    out += ">\n";
    std::vector<render_task> work;
    push_children(work, doc.nodes, 0, TextMode::Plain);
    while(!work.empty()){
        render_task task = work.back();
        work.pop_back();
        if(!task.node){ out += task.tail; continue; }
        if(const Text* t = as_text(*task.node)) render_text(*t, task.mode, out);
        else render_block(std::get<Block>(task.node->data), task.part_level, out, work);
    }
    out += "</div>\n";
    return out;
}

} // namespace lmm
