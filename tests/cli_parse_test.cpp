// cli_parse_test.cpp
// MIT License (c) 2026 Pedro

#include <gtest/gtest.h>

#include "core/cli_parse.h"

using namespace mockforge::core;

TEST(CliParseTest, PositiveIntRejectsZeroAndTrailingText) {
    int value = 7;
    EXPECT_TRUE(parse_positive_int("42", value));
    EXPECT_EQ(value, 42);
    EXPECT_FALSE(parse_positive_int("0", value));
    EXPECT_FALSE(parse_positive_int("-3", value));
    EXPECT_FALSE(parse_positive_int("12px", value));
    EXPECT_FALSE(parse_positive_int("", value));
    EXPECT_EQ(value, 42);
}

TEST(CliParseTest, NonNegativeIntAcceptsZero) {
    int value = 5;
    EXPECT_TRUE(parse_non_negative_int("0", value));
    EXPECT_EQ(value, 0);
    EXPECT_FALSE(parse_non_negative_int("-1", value));
}

TEST(CliParseTest, ParseDoubleRejectsGarbage) {
    double value = 0.0;
    EXPECT_TRUE(parse_double("1.15", value));
    EXPECT_DOUBLE_EQ(value, 1.15);
    EXPECT_FALSE(parse_double("1.15x", value));
    EXPECT_FALSE(parse_double("inf", value));
}

TEST(CliParseTest, ParseBoolVariants) {
    bool value = false;
    EXPECT_TRUE(parse_bool_value("Yes", value));
    EXPECT_TRUE(value);
    EXPECT_TRUE(parse_bool_value("off", value));
    EXPECT_FALSE(value);
    EXPECT_FALSE(parse_bool_value("maybe", value));
}

TEST(CliParseTest, ParseSize) {
    int w = 0;
    int h = 0;
    EXPECT_TRUE(parse_size("3000x2250", w, h));
    EXPECT_EQ(w, 3000);
    EXPECT_EQ(h, 2250);
    EXPECT_TRUE(parse_size(" 20X10 ", w, h));
    EXPECT_EQ(w, 20);
    EXPECT_EQ(h, 10);
    EXPECT_FALSE(parse_size("x10", w, h));
    EXPECT_FALSE(parse_size("10x0", w, h));
    EXPECT_FALSE(parse_size("10", w, h));
}

TEST(CliParseTest, ParseColorWithOptionalAlpha) {
    std::array<unsigned char, 4> color{};
    EXPECT_TRUE(parse_color("225, 213, 213", color));
    EXPECT_EQ(color, (std::array<unsigned char, 4>{225, 213, 213, 255}));
    EXPECT_TRUE(parse_color("1,2,3,4", color));
    EXPECT_EQ(color, (std::array<unsigned char, 4>{1, 2, 3, 4}));
    EXPECT_FALSE(parse_color("1,2", color));
    EXPECT_FALSE(parse_color("1,2,256", color));
    EXPECT_FALSE(parse_color("1,,3", color));
}

TEST(CliParseTest, TrimAndLower) {
    EXPECT_EQ(trim_copy("  a b \t"), "a b");
    EXPECT_EQ(to_lower_copy("Around_TEXT"), "around_text");
    EXPECT_EQ(to_quoted("a\"b"), "\"a\\\"b\"");
}
