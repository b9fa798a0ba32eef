#include <gtest/gtest.h>
#include <sheet_placement/a1_notation.hpp>

using namespace sheet_placement;

TEST(A1NotationTest, ColumnLettersRoundTrip) {
    EXPECT_EQ(column_index("A"), 0);
    EXPECT_EQ(column_index("Z"), 25);
    EXPECT_EQ(column_index("AA"), 26);
    EXPECT_EQ(column_index("az"), 51);
    EXPECT_EQ(column_letters(0), "A");
    EXPECT_EQ(column_letters(25), "Z");
    EXPECT_EQ(column_letters(26), "AA");
    EXPECT_EQ(column_letters(701), "ZZ");
    EXPECT_EQ(column_letters(702), "AAA");
    for (int i = 0; i < 1000; i += 37)
        EXPECT_EQ(column_index(column_letters(i)), i);
}

TEST(A1NotationTest, SingleCell) {
    const A1Range r = parse_a1("A1");
    EXPECT_FALSE(r.sheet_name);
    EXPECT_EQ(r.start_row, 0);
    EXPECT_EQ(r.end_row, 1);
    EXPECT_EQ(r.start_column, 0);
    EXPECT_EQ(r.end_column, 1);
}

TEST(A1NotationTest, CellRange) {
    const A1Range r = parse_a1("A1:B5");
    EXPECT_EQ(r.start_row, 0);
    EXPECT_EQ(r.end_row, 5);
    EXPECT_EQ(r.start_column, 0);
    EXPECT_EQ(r.end_column, 2);
}

TEST(A1NotationTest, WholeColumnsHaveNoRowBounds) {
    const A1Range r = parse_a1("B:D");
    EXPECT_EQ(r.start_row, 0);
    EXPECT_FALSE(r.end_row);
    EXPECT_EQ(r.start_column, 1);
    EXPECT_EQ(r.end_column, 4);
}

TEST(A1NotationTest, SheetPrefix) {
    const A1Range plain = parse_a1("Sheet1!C3");
    ASSERT_TRUE(plain.sheet_name);
    EXPECT_EQ(*plain.sheet_name, "Sheet1");
    EXPECT_EQ(plain.start_row, 2);
    EXPECT_EQ(plain.start_column, 2);

    const A1Range quoted = parse_a1("'My Sheet'!AA10");
    ASSERT_TRUE(quoted.sheet_name);
    EXPECT_EQ(*quoted.sheet_name, "My Sheet");
    EXPECT_EQ(quoted.start_row, 9);
    EXPECT_EQ(quoted.start_column, 26);
}

TEST(A1NotationTest, RejectsMalformedNotation) {
    EXPECT_THROW(parse_a1(""), A1Error);
    EXPECT_THROW(parse_a1("1A"), A1Error);
    EXPECT_THROW(parse_a1("A0"), A1Error);
    EXPECT_THROW(parse_a1("A-1"), A1Error);
    EXPECT_THROW(parse_a1("Sheet1!"), A1Error);
    EXPECT_THROW(column_index(""), A1Error);
    EXPECT_THROW(column_letters(-1), A1Error);
}
