#include <gtest/gtest.h>
#include "lmm/diagnostics_json.hpp"
#include "lmm/parser.hpp"

using namespace lmm;

TEST(DiagnosticsJson, CleanParse){
    auto js = diagnostics_to_json(parse_document("hello\n"));
    EXPECT_EQ(js, "{\"success\":true,\"diagnostics\":[]}");
}

TEST(DiagnosticsJson, ErrorRangeUsesUtf16Columns){
    // U+1F600 takes two UTF-16 units
    auto js = diagnostics_to_json(parse_document("@\xF0\x9F\x98\x80"));
    EXPECT_EQ(js,
        "{\"success\":false,\"diagnostics\":[{\"severity\":1,"
        "\"message\":\"block header missing opening delimiter\",\"source\":\"lmm\","
        "\"range\":{\"start\":{\"line\":0,\"character\":0},\"end\":{\"line\":0,\"character\":3}}}]}");
}

TEST(DiagnosticsJson, WarningsAloneStillSucceed){
    auto js = diagnostics_to_json(parse_document("@part{x}"));
    EXPECT_NE(js.find("\"success\":true"), std::string::npos);
    EXPECT_NE(js.find("\"severity\":2"), std::string::npos);
    EXPECT_NE(js.find("(write '@part {')"), std::string::npos);
}

TEST(DiagnosticsJson, Escape){
    EXPECT_EQ(json_escape("a\"b\\c\n\t"), "\"a\\\"b\\\\c\\n\\t\"");
    EXPECT_EQ(json_escape(std::string("\x01", 1)), "\"\\u0001\"");
}

TEST(DiagnosticsJson, ControlCharacters){
    EXPECT_EQ(json_escape("\b\f\r"), "\"\\b\\f\\r\"");
    EXPECT_EQ(json_escape(std::string("a\x1f", 2)), "\"a\\u001f\"");
    EXPECT_EQ(json_escape("caf\xC3\xA9"), "\"caf\xC3\xA9\"");
}
