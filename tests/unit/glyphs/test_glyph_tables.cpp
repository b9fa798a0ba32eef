#include <gtest/gtest.h>
#include <glyphs/glyph_tables.hpp>
#include <glyphs/text_cells.hpp>

using namespace glyphs;

TEST(BoxStyleTest, EveryStyleSuppliesAllGlyphs) {
    for (auto name : box_style_names()) {
        const BoxStyle& s = box_style(name);
        EXPECT_EQ(s.name, name);
        for (auto g : { s.horizontal, s.vertical, s.top_left, s.top_right, s.bottom_left,
                        s.bottom_right, s.t_down, s.t_up, s.t_right, s.t_left, s.cross }) {
            EXPECT_EQ(cell_width(g), 1) << "style " << name;
        }
    }
    EXPECT_EQ(box_style_names().size(), 4u);
}

TEST(BoxStyleTest, UnknownNameFallsBackToLight) {
    EXPECT_EQ(&box_style("nope"), &default_box_style());
    EXPECT_EQ(box_style("").name, "light");
    EXPECT_EQ(box_style("heavy").top_left, "┏");
    EXPECT_EQ(box_style("double").cross, "╬");
    EXPECT_EQ(box_style("rounded").bottom_right, "╯");
}

TEST(PaletteTest, NamedPalettesAreOrderedRamps) {
    EXPECT_EQ(palette("blocks").size(), 5u);
    EXPECT_EQ(palette("ascii").size(), 10u);
    EXPECT_EQ(palette("dots").size(), 9u);
    EXPECT_EQ(palette("bars").size(), 9u);
    EXPECT_EQ(palette("minimal").size(), 4u);
    for (auto name : palette_names()) {
        const Palette& p = palette(name);
        EXPECT_EQ(p.front(), " ") << name;
        for (auto c : p)
            EXPECT_EQ(cell_width(c), 1) << name;
    }
}

TEST(PaletteTest, UnknownNameFallsBackToBlocks) {
    EXPECT_EQ(&palette("sepia"), &palette("blocks"));
}

TEST(RampTest, EndsAreFullBlocks) {
    EXPECT_EQ(fill_ramp[0], full_block);
    EXPECT_EQ(fill_ramp[7], "▏");
    EXPECT_EQ(spark_ramp[0], "▁");
    EXPECT_EQ(spark_ramp[4], "▅");
    EXPECT_EQ(spark_ramp[7], full_block);
}
