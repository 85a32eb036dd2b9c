#include <gtest/gtest.h>

#include "app.hpp"

TEST(OptionsTest, EachModeAlone) {
    EXPECT_EQ(parse_options({"--setup"}).options.mode, Mode::Setup);
    EXPECT_EQ(parse_options({"--emulate"}).options.mode, Mode::Emulate);
    EXPECT_EQ(parse_options({"--identify"}).options.mode, Mode::Identify);
    EXPECT_EQ(parse_options({"--monitor"}).options.mode, Mode::Monitor);
    EXPECT_TRUE(parse_options({"--setup"}).ok);
}

TEST(OptionsTest, NoModeIsAnError) {
    ParseResult result = parse_options({});
    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());

    EXPECT_FALSE(parse_options({"--debug"}).ok);
}

TEST(OptionsTest, TwoModesAreAnError) {
    EXPECT_FALSE(parse_options({"--setup", "--emulate"}).ok);
    EXPECT_FALSE(parse_options({"--identify", "--identify"}).ok);
}

TEST(OptionsTest, UnknownArgumentIsAnError) {
    ParseResult result = parse_options({"--setup", "--frobnicate"});
    EXPECT_FALSE(result.ok);
    EXPECT_NE(result.error.find("--frobnicate"), std::string::npos);
}

TEST(OptionsTest, DebugAndHelp) {
    ParseResult result = parse_options({"-d", "--emulate"});
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.options.debug);

    result = parse_options({"--help"});
    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.options.help);
}
