#include "cli_options.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>

TEST(ParseInteger, AcceptsValuesInRange) {
    uint16_t feed = 0;
    EXPECT_TRUE(parse_integer("40", 0, 0xFFFF, feed));
    EXPECT_EQ(feed, 40);
    EXPECT_TRUE(parse_integer("65535", 0, 0xFFFF, feed));
    EXPECT_EQ(feed, 65535);

    size_t chunk = 0;
    EXPECT_TRUE(parse_integer("+64", 1, 512, chunk));
    EXPECT_EQ(chunk, 64u);
}

TEST(ParseInteger, NegativeValuesDoNotWrap) {
    uint16_t feed = 40;
    EXPECT_FALSE(parse_integer("-1", 0, 0xFFFF, feed));
    EXPECT_EQ(feed, 40);

    size_t chunk = 64;
    EXPECT_FALSE(parse_integer("-5", 1, 512, chunk));
    EXPECT_EQ(chunk, 64u);

    uint16_t energy = 12000;
    EXPECT_FALSE(parse_integer("-12000", 0, 0xFFFF, energy));
    EXPECT_EQ(energy, 12000);
}

TEST(ParseInteger, RejectsOutOfRange) {
    uint16_t feed = 40;
    EXPECT_FALSE(parse_integer("65536", 0, 0xFFFF, feed));
    EXPECT_FALSE(parse_integer("99999999999999999999999", 0, 0xFFFF, feed));

    int rows = 1;
    EXPECT_FALSE(parse_integer("0", 1, 5, rows));
    EXPECT_FALSE(parse_integer("6", 1, 5, rows));
    EXPECT_EQ(rows, 1);

    int delay = 20;
    EXPECT_TRUE(parse_integer("0", 0, 10000, delay));
    EXPECT_EQ(delay, 0);
}

TEST(ParseInteger, RejectsMalformedText) {
    int value = 7;
    EXPECT_FALSE(parse_integer("", 0, 100, value));
    EXPECT_FALSE(parse_integer(" 5", 0, 100, value));
    EXPECT_FALSE(parse_integer("5 ", 0, 100, value));
    EXPECT_FALSE(parse_integer("5x", 0, 100, value));
    EXPECT_FALSE(parse_integer("1.5", 0, 100, value));
    EXPECT_FALSE(parse_integer("abc", 0, 100, value));
    EXPECT_EQ(value, 7);
}

TEST(ParseDecimal, RangeAndFormat) {
    float size = 16.0f;
    EXPECT_TRUE(parse_decimal("24", 1.0, 256.0, size));
    EXPECT_FLOAT_EQ(size, 24.0f);
    EXPECT_TRUE(parse_decimal("1.25", 0.5, 10.0, size));
    EXPECT_FLOAT_EQ(size, 1.25f);

    EXPECT_FALSE(parse_decimal("-16", 1.0, 256.0, size));
    EXPECT_FALSE(parse_decimal("0", 1.0, 256.0, size));
    EXPECT_FALSE(parse_decimal("nan", 1.0, 256.0, size));
    EXPECT_FALSE(parse_decimal("inf", 1.0, 256.0, size));
    EXPECT_FALSE(parse_decimal("2.5pt", 1.0, 256.0, size));
    EXPECT_FLOAT_EQ(size, 1.25f);
}
