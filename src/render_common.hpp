// Helpers shared by the Markdown and HTML backends
#pragma once
#include "lmm/ast.hpp"
#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace lmm::render_detail {

enum class ListStyle { Bullet, Line };

// A marker counts when it is a param key or a bare argument.
inline bool has_marker(const Block& b, std::string_view key){
    for(auto& p: b.params) if(p.key == key) return true;
    for(auto& a: b.args) if(a == key) return true;
    return false;
}

inline ListStyle list_style(const Block& b){
    if(has_marker(b, "bullet")) return ListStyle::Bullet;
    if(has_marker(b, "line")) return ListStyle::Line;
    return ListStyle::Bullet;
}

// How a Text node renders: as paragraphs, or as items of the enclosing list.
enum class TextMode { Plain, BulletItems, LineItems };

// Pending step of a tree walk. A null node emits tail (the closing markup of
// the block whose children were pushed after it).
struct render_task {
    const Node* node = nullptr;
    size_t part_level = 0;
    TextMode mode = TextMode::Plain;
    const char* tail = "";
};

// Children go on in reverse so they pop in document order.
inline void push_children(std::vector<render_task>& work, const std::vector<Node>& nodes, size_t part_level, TextMode mode){
    for(auto it = nodes.rbegin(); it != nodes.rend(); ++it) work.push_back({&*it, part_level, mode, ""});
}

inline void push_tail(std::vector<render_task>& work, const char* tail){
    work.push_back({nullptr, 0, TextMode::Plain, tail});
}

inline TextMode item_mode(const Block& list){
    return list_style(list) == ListStyle::Bullet ? TextMode::BulletItems : TextMode::LineItems;
}

// Depth of 'part' headings is capped at <h6>.
inline size_t heading_level(size_t part_level){ return std::min<size_t>(part_level + 1, 6); }

inline std::string part_title(const Block& b){
    if(b.args.empty()) return "part";
    std::string out;
    for(size_t i=0;i<b.args.size();++i){ if(i) out += ' '; out += b.args[i]; }
    return out;
}

inline std::string param_value(const Block& b, std::string_view key){
    for(auto& p: b.params) if(p.key == key) return p.value;
    return std::string();
}

inline void escape_html_into(std::string& out, std::string_view s){
    for(char c: s){
        switch(c){
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
}

// Lowercase ASCII alnum, '-' and '_' are kept; whitespace and ':' become '-';
// everything else is dropped.
inline std::string sanitize_html_ident(std::string_view s){
    std::string out;
    for(char c: s){
        unsigned char u = static_cast<unsigned char>(c);
        if((u >= 'a' && u <= 'z') || (u >= '0' && u <= '9') || c == '-' || c == '_') out += c;
        else if(u >= 'A' && u <= 'Z') out += static_cast<char>(u - 'A' + 'a');
        else if(c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == ':') out += '-';
    }
    return out;
}

} // namespace lmm::render_detail
