#include <gtest/gtest.h>
#include <diagram_render/table.hpp>

using diagram_model::Diagram;
using namespace diagram_render;

TEST(TableTest, ColumnWidthsTakeWidestCell) {
    EXPECT_EQ(table_column_widths({ "A", "BB" }, { { "x", "yyy" } }), (std::vector<int>{ 1, 3 }));
    EXPECT_EQ(table_column_widths({ "A" }, { { "x", "ignored" }, { "wide" } }), (std::vector<int>{ 4 }));
}

TEST(TableTest, RendersHeaderSeparatorAndRows) {
    const Diagram table = render_table({ "A", "BB" }, { { "x", "yyy" } });
    EXPECT_EQ(table, (Diagram{
        "┌───┬─────┐",
        "│ A │ BB  │",
        "├───┼─────┤",
        "│ x │ yyy │",
        "└───┴─────┘",
    }));
}

TEST(TableTest, ShortRowsGetEmptyCellsAndLongRowsAreCut) {
    const Diagram table = render_table({ "a", "b" }, { { "1" }, { "1", "2", "3" } });
    ASSERT_EQ(table.size(), 6u);
    EXPECT_EQ(table[3], "│ 1 │   │");
    EXPECT_EQ(table[4], "│ 1 │ 2 │");
}

TEST(TableTest, DoubleStyle) {
    const Diagram table = render_table({ "k" }, {}, glyphs::box_style("double"));
    EXPECT_EQ(table, (Diagram{ "╔═══╗", "║ k ║", "╠═══╣", "╚═══╝" }));
}

TEST(TableTest, NoHeadersRendersNothing) {
    EXPECT_TRUE(render_table({}, { { "x" } }).empty());
}
