#include <gtest/gtest.h>
#include <diagram_layout/layout_engine.hpp>
#include <glyphs/text_cells.hpp>

using namespace diagram_model;
using diagram_layout::layout_diagram;

namespace {

BoxElement box(std::vector<std::string> lines) {
    BoxElement b;
    b.lines = std::move(lines);
    return b;
}

ArrowElement arrow(ArrowDirection direction, int length = 1, int x = 0) {
    ArrowElement a;
    a.direction = direction;
    a.length = length;
    a.x = x;
    return a;
}

} // namespace

TEST(LayoutEngineTest, TitleThenCenteredBox) {
    const Diagram d = layout_diagram({ TitleElement{ "T" }, box({ "X" }) }, 10);
    EXPECT_EQ(d, (Diagram{ "═══ T ════", "   ┌───┐", "   │ X │", "   └───┘" }));
}

TEST(LayoutEngineTest, BoxBeforeDownArrowGetsConnector) {
    const Diagram d = layout_diagram({ box({ "X" }), arrow(ArrowDirection::Down) }, 10);
    EXPECT_EQ(d, (Diagram{ "   ┌───┐", "   │ X │", "   └─┴─┘", "     │", "     ▼" }));
}

TEST(LayoutEngineTest, ConnectorOnlyForDownArrows) {
    const Diagram up = layout_diagram({ box({ "X" }), arrow(ArrowDirection::Up) }, 10);
    EXPECT_EQ(up[2], "   └───┘");

    const Diagram last = layout_diagram({ box({ "X" }) }, 10);
    EXPECT_EQ(last.back(), "   └───┘");
    EXPECT_EQ(last.front(), "   ┌───┐");
}

TEST(LayoutEngineTest, ExplicitConnectorsAreKept) {
    BoxElement b = box({ "X" });
    b.top_connector = true;
    b.bottom_connector = true;
    const Diagram d = layout_diagram({ b }, 10);
    EXPECT_EQ(d.front(), "   ┌─┬─┐");
    EXPECT_EQ(d.back(), "   └─┴─┘");
}

TEST(LayoutEngineTest, CommentOnMiddleContentLine) {
    BoxElement b = box({ "a", "b" });
    b.comment = "c";
    const Diagram d = layout_diagram({ b }, 20);
    ASSERT_EQ(d.size(), 4u);
    EXPECT_EQ(d[2], "        │ b │  ◀─ c");
    EXPECT_EQ(d[1], "        │ a │");

    b.lines = { "a", "b", "c" };
    const Diagram odd = layout_diagram({ b }, 20);
    EXPECT_EQ(odd[2], "        │ b │  ◀─ c");
}

TEST(LayoutEngineTest, PositionedBoxIgnoresCommentAndCentering) {
    BoxElement b = box({ "X" });
    b.x = 4;
    b.comment = "ignored";
    const Diagram d = layout_diagram({ b }, 30);
    EXPECT_EQ(d, (Diagram{ "    ┌───┐", "    │ X │", "    └───┘" }));
}

TEST(LayoutEngineTest, BoxWiderThanDiagramIsNotIndented) {
    const Diagram d = layout_diagram({ box({ "abcdef" }) }, 8);
    EXPECT_EQ(d.front(), "┌────────┐");
}

TEST(LayoutEngineTest, TextSpacerAndComment) {
    TextElement t;
    t.text = "hello";
    t.x = 3;
    t.comment = "note";
    const Diagram d = layout_diagram({ t, SpacerElement{} }, 40);
    EXPECT_EQ(d, (Diagram{ "   hello  ◀─ note", "" }));
}

TEST(LayoutEngineTest, ArrowPlacement) {
    EXPECT_EQ(layout_diagram({ arrow(ArrowDirection::Down, 2, 4) }, 40), (Diagram{ "    │", "    │", "    ▼" }));
    EXPECT_EQ(layout_diagram({ arrow(ArrowDirection::Up) }, 8), (Diagram{ "    ▲", "    │" }));
    EXPECT_EQ(layout_diagram({ arrow(ArrowDirection::Right) }, 40), (Diagram{ "─▶" }));
    EXPECT_EQ(layout_diagram({ arrow(ArrowDirection::Left, 1, 2) }, 40), (Diagram{ "  ◀─" }));
}

TEST(LayoutEngineTest, RowIsCentered) {
    RowElement row;
    row.boxes = { RowBox{ { "A" } }, RowBox{ { "B" } } };
    const Diagram d = layout_diagram({ row }, 20);
    EXPECT_EQ(d.front(), "    ┌───┐  ┌───┐");

    const Diagram narrow = layout_diagram({ row }, 8);
    EXPECT_EQ(narrow.front(), "┌───┐  ┌───┐");
}

TEST(LayoutEngineTest, ChartsAreIndentedByX) {
    SparklineElement spark;
    spark.data = { 1, 1, 1 };
    spark.x = 2;
    ProgressElement progress;
    progress.value = 1;
    progress.max = 2;
    progress.width = 2;
    progress.x = 1;
    const Diagram d = layout_diagram({ spark, progress }, 40);
    EXPECT_EQ(d, (Diagram{ "  ▅▅▅", " [█░]  50%" }));
}

TEST(LayoutEngineTest, TableAndShadedBoxUseNamedStyles) {
    TableElement table;
    table.headers = { "k" };
    table.box_style = "heavy";
    table.x = 1;
    ShadedBoxElement shaded;
    shaded.width = 2;
    shaded.height = 1;
    shaded.box_style = "no-such-style";
    const Diagram d = layout_diagram({ table, shaded }, 40);
    ASSERT_EQ(d.size(), 7u);
    EXPECT_EQ(d[0], " ┏━━━┓");
    EXPECT_EQ(d[4], "┌──┐");
}

TEST(LayoutEngineTest, UnknownElementsRenderNothing) {
    EXPECT_TRUE(layout_diagram({ UnknownElement{ "flowchart" } }, 20).empty());
    EXPECT_EQ(layout_diagram({ UnknownElement{ "x" }, TitleElement{ "T" } }, 10), (Diagram{ "═══ T ════" }));
}

TEST(LayoutEngineTest, FrameWrapsAndNarrowsContent) {
    TextElement t;
    t.text = "hi";
    EXPECT_EQ(layout_diagram({ t }, 10, true), (Diagram{
        "┌╌╌╌╌╌╌╌╌┐",
        "╎        ╎",
        "╎ hi     ╎",
        "╎        ╎",
        "└╌╌╌╌╌╌╌╌┘",
    }));
    EXPECT_EQ(layout_diagram({ TitleElement{ "T" } }, 10, true)[2], "╎ ═ T ══ ╎");
}

TEST(LayoutEngineTest, FramedDiagramIsRectangular) {
    BoxElement wide = box({ "this line is far wider than the frame" });
    const Diagram d = layout_diagram({ TitleElement{ "T" }, wide, arrow(ArrowDirection::Down) }, 24, true);
    for (const auto& line : d)
        EXPECT_EQ(glyphs::cell_width(line), 24) << line;
}

TEST(LayoutEngineTest, RenderingIsDeterministic) {
    BarChartElement bars;
    bars.data = { { "a", 3 }, { "b", 7.5 } };
    VerticalBarChartElement columns;
    columns.data = bars.data;
    RowElement row;
    row.boxes = { RowBox{ { "L" } }, RowBox{ { "R" } } };
    row.merge = true;
    const std::vector<Element> elements = {
        TitleElement{ "Pipeline" }, box({ "in" }), arrow(ArrowDirection::Down), row,
        bars, columns, ShadedBoxElement{}, TableElement{ { "h" }, { { "v" } }, "light", 0 },
    };
    EXPECT_EQ(layout_diagram(elements, 60, true), layout_diagram(elements, 60, true));
}

TEST(LayoutEngineTest, RequestHelpers) {
    DiagramRequest request;
    request.elements = { TitleElement{ "T" } };
    request.width = 10;
    const Diagram d = diagram_layout::layout_request(request);
    EXPECT_EQ(d, (Diagram{ "═══ T ════" }));
    EXPECT_EQ(diagram_layout::join_lines({ "a", "b" }), "a\nb");
    EXPECT_EQ(diagram_layout::join_lines({}), "");
    EXPECT_EQ(diagram_layout::diagram_width({ "ab", "┌──┐", "" }), 4);
}
