#include <gtest/gtest.h>
#include "test_env.hpp"
#include "lmm/env.hpp"
#include "lmm/diagnostics_json.hpp"
#include "lmm/parser.hpp"

using namespace lmm;

TEST(Env, FlagValues){
    _putenv("LMM_TEST_FLAG=1");
    EXPECT_TRUE(env_flag_enabled("LMM_TEST_FLAG"));
    _putenv("LMM_TEST_FLAG=yes");
    EXPECT_TRUE(env_flag_enabled("LMM_TEST_FLAG"));
    _putenv("LMM_TEST_FLAG=T");
    EXPECT_TRUE(env_flag_enabled("LMM_TEST_FLAG"));
    _putenv("LMM_TEST_FLAG=0");
    EXPECT_FALSE(env_flag_enabled("LMM_TEST_FLAG"));
    _putenv("LMM_TEST_FLAG=");
    EXPECT_FALSE(env_flag_enabled("LMM_TEST_FLAG"));
}

TEST(Env, OptionsDefaults){
    _putenv("LMM_SPACE_WIDTH=");
    _putenv("LMM_TAB_WIDTH=");
    auto o = options_from_env();
    EXPECT_EQ(o.space_width, 1u);
    EXPECT_EQ(o.tab_width, 2u);
}

TEST(Env, OptionsOverrides){
    _putenv("LMM_SPACE_WIDTH=2");
    _putenv("LMM_TAB_WIDTH=8");
    auto o = options_from_env();
    EXPECT_EQ(o.space_width, 2u);
    EXPECT_EQ(o.tab_width, 8u);
    auto r = parse_document(" \tx\n", o);
    EXPECT_EQ(std::get<Text>(r.document.nodes[0].data).lines[0].indent, 10u);
    _putenv("LMM_SPACE_WIDTH=");
    _putenv("LMM_TAB_WIDTH=");
}

TEST(Env, InvalidWidthsKeepDefaults){
    _putenv("LMM_SPACE_WIDTH=-3");
    _putenv("LMM_TAB_WIDTH=4x");
    auto o = options_from_env();
    EXPECT_EQ(o.space_width, 1u);
    EXPECT_EQ(o.tab_width, 2u);
    _putenv("LMM_SPACE_WIDTH=");
    _putenv("LMM_TAB_WIDTH=");
}

TEST(Env, DebugTracingDoesNotChangeResults){
    const char* src = "#t: x\n@a { @b{ y }\n$\nz\n";
    auto quiet = parse_document(src);
    _putenv("LMM_DEBUG_PARSE=1");
    _putenv("LMM_DIAG_JSON=1");
    auto loud = parse_document(src);
    maybe_print_json(loud);
    _putenv("LMM_DEBUG_PARSE=");
    _putenv("LMM_DIAG_JSON=");
    EXPECT_TRUE(equal(quiet.document, loud.document, false));
    EXPECT_EQ(diagnostics_to_json(quiet), diagnostics_to_json(loud));
}
