#include <gtest/gtest.h>
#include "lmm/parser.hpp"
#include "lmm/render.hpp"
#include "render_common.hpp"

using namespace lmm;

static std::string html(const char* src){ return render_html(parse_document(src).document); }

TEST(RenderHtml, EndToEnd){
    const char* src =
        "#title: Demo\n"
        "@part Hello World {\n"
        "  @list[bullet] {\n"
        "    First item\n"
        "    Second item\n"
        "  }\n"
        "  @code[lang=rust] {\n"
        "    println!(\"hi\");\n"
        "  }\n"
        "}\n";
    EXPECT_EQ(html(src),
        "<div class=\"lmm-document\" data-title=\"Demo\">\n"
        "<section class=\"lmm-part\">\n"
        "<h1>Hello World</h1>\n"
        "<ul class=\"lmm-list\" data-param-bullet=\"\">\n"
        "<li>First item</li>\n"
        "<li>Second item</li>\n"
        "</ul>\n"
        "<pre class=\"lmm-code\" data-param-lang=\"rust\"><code class=\"language-rust\">println!(&quot;hi&quot;);\n"
        "</code></pre>\n"
        "</section>\n"
        "</div>\n");
}

TEST(RenderHtml, EmptyDocument){
    EXPECT_EQ(html(""), "<div class=\"lmm-document\">\n</div>\n");
}

TEST(RenderHtml, ParagraphsAreEscapedAndCommentsDropped){
    EXPECT_EQ(html("<a href='x'> & \"q\"\n! secret\n"),
        "<div class=\"lmm-document\">\n"
        "<p>&lt;a href=&#39;x&#39;&gt; &amp; &quot;q&quot;</p>\n"
        "</div>\n");
}

TEST(RenderHtml, GenericBlockWrapperAndAttributes){
    EXPECT_EQ(html("@Side:Note [Data Key=v<1] {\n  #Class: lead\n  body\n}\n"),
        "<div class=\"lmm-document\">\n"
        "<div class=\"lmm-block lmm-block-side\" data-class=\"lead\" data-param-data-key=\"v&lt;1\">\n"
        "<p>body</p>\n"
        "</div>\n"
        "</div>\n");
}

TEST(RenderHtml, EmptySanitizedKeysAreSkipped){
    EXPECT_EQ(html("@x[!!=1, ok=2] {\n}\n"),
        "<div class=\"lmm-document\">\n"
        "<div class=\"lmm-block lmm-block-x\" data-param-ok=\"2\">\n"
        "</div>\n"
        "</div>\n");
}

TEST(RenderHtml, LineStyleList){
    EXPECT_EQ(html("@list line {\n  a\n  b\n}\n"),
        "<div class=\"lmm-document\">\n"
        "<div class=\"lmm-lines\">\n"
        "<div class=\"lmm-line\">a</div>\n"
        "<div class=\"lmm-line\">b</div>\n"
        "</div>\n"
        "</div>\n");
}

TEST(RenderHtml, CodeWithoutLang){
    EXPECT_EQ(html("@code {\n  x<y\n}\n"),
        "<div class=\"lmm-document\">\n"
        "<pre class=\"lmm-code\"><code>x&lt;y\n"
        "</code></pre>\n"
        "</div>\n");
}

TEST(RenderHtml, NestedPartHeadings){
    auto out = html("@part A {\n  @part B {\n  }\n}\n");
    EXPECT_NE(out.find("<h1>A</h1>"), std::string::npos);
    EXPECT_NE(out.find("<h2>B</h2>"), std::string::npos);
}

TEST(RenderHtml, SanitizeIdent){
    using render_detail::sanitize_html_ident;
    EXPECT_EQ(sanitize_html_ident("Hello World"), "hello-world");
    EXPECT_EQ(sanitize_html_ident("a:b_c-D"), "a-b_c-d");
    EXPECT_EQ(sanitize_html_ident("\xC3\xA9t\xC3\xA9!"), "t");
    EXPECT_EQ(sanitize_html_ident("!!"), "");
}
