#include "lmm/parser.hpp"
#include "lmm/render.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;

struct RunResult { double ms_parse; double ms_markdown; double ms_html; size_t diags; size_t md_bytes; size_t html_bytes; };

static RunResult bench_case(const char* name, const std::string &doc){
    auto t0 = Clock::now();
    auto r = lmm::parse_document(doc);
    auto t1 = Clock::now();
    auto md = lmm::render_markdown(r.document);
    auto t2 = Clock::now();
    auto html = lmm::render_html(r.document);
    auto t3 = Clock::now();
    if(r.has_errors())
        std::cerr << "[bench] case '" << name << "' produced " << r.error_count() << " error(s)\n";
    auto ms = [](Clock::time_point a, Clock::time_point b){ return std::chrono::duration<double, std::milli>(b - a).count(); };
    return { ms(t0, t1), ms(t1, t2), ms(t2, t3), r.diagnostics.size(), md.size(), html.size() };
}

static std::string flat_parts(size_t n){
    std::string s = "# title: Bench\n# author: lmm\n\n";
    for(size_t i=0;i<n;++i){
        s += "@part Section " + std::to_string(i) + " {\n";
        s += "  Some text with @@ and ## escapes on line " + std::to_string(i) + "\n";
        s += "  ! a comment\n";
        s += "  @list bullet {\n    one\n    two\n    three\n  }\n";
        s += "  @code[lang=cpp] {\n    $\n    int main() { return 0; }\n    $\n  }\n";
        s += "}\n\n";
    }
    return s;
}

static std::string deep_nesting(size_t depth){
    std::string s;
    for(size_t i=0;i<depth;++i) s += std::string(i, ' ') + "@part level" + std::to_string(i) + " {\n";
    s += "leaf text\n";
    for(size_t i=depth;i>0;--i) s += std::string(i-1, ' ') + "}\n";
    return s;
}

// Unbalanced input: exercises recovery paths.
static std::string broken(size_t n){
    std::string s;
    for(size_t i=0;i<n;++i){
        s += "@part x" + std::to_string(i) + "\n";
        s += "text without any brace " + std::to_string(i) + "\n";
        s += "#bad attribute line\n";
    }
    return s;
}

static std::string unicode_text(size_t n){
    std::string s = "@part Unicode {\n";
    for(size_t i=0;i<n;++i) s += "  h\xC3\xA9llo w\xC3\xB6rld \xF0\x9F\x98\x80 \xE4\xB8\xAD\xE6\x96\x87\n";
    s += "}\n";
    return s;
}

int main(){
    struct Case { const char* name; std::string doc; };
    std::vector<Case> cases;
    cases.push_back({ "flat_parts", flat_parts(2000) });
    cases.push_back({ "deep_nesting", deep_nesting(500) });
    cases.push_back({ "recovery", broken(2000) });
    cases.push_back({ "unicode_text", unicode_text(5000) });

    std::cout << "name,bytes,ms_parse,ms_markdown,ms_html,diagnostics,md_bytes,html_bytes\n";
    for(const auto &c : cases){
        auto r = bench_case(c.name, c.doc);
        std::cout << c.name << "," << c.doc.size() << "," << r.ms_parse << "," << r.ms_markdown << "," << r.ms_html
                  << "," << r.diags << "," << r.md_bytes << "," << r.html_bytes << "\n";
    }
    return 0;
}
