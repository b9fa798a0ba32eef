#include <gtest/gtest.h>
#include <sheet_placement/batch_requests.hpp>

using nlohmann::json;
using namespace sheet_placement;

TEST(BatchRequestsTest, PlacesOneLinePerRowAtAnchor) {
    const diagram_model::Diagram diagram = { "ab", "┌──┐" };
    const json body = build_diagram_requests(diagram, 7, parse_a1("B3"));
    const json& requests = body.at("requests");
    ASSERT_EQ(requests.size(), 4u);

    const json& cells = requests[0].at("updateCells");
    EXPECT_EQ(cells["range"]["sheetId"], 7);
    EXPECT_EQ(cells["range"]["startRowIndex"], 2);
    EXPECT_EQ(cells["range"]["endRowIndex"], 4);
    EXPECT_EQ(cells["range"]["startColumnIndex"], 1);
    EXPECT_EQ(cells["range"]["endColumnIndex"], 2);
    ASSERT_EQ(cells["rows"].size(), 2u);
    const json& value = cells["rows"][1]["values"][0];
    EXPECT_EQ(value["userEnteredValue"]["stringValue"], "┌──┐");
    EXPECT_EQ(value["userEnteredFormat"]["textFormat"]["fontFamily"], "Roboto Mono");
}

TEST(BatchRequestsTest, SizesColumnAndRows) {
    const json body = build_diagram_requests({ "ab", "┌──┐" }, 0, parse_a1("A1"));
    const json& requests = body["requests"];

    const json& column = requests[1]["updateDimensionProperties"];
    EXPECT_EQ(column["range"]["dimension"], "COLUMNS");
    EXPECT_EQ(column["range"]["startIndex"], 0);
    EXPECT_EQ(column["range"]["endIndex"], 1);
    EXPECT_EQ(column["properties"]["pixelSize"], 100);

    const json& rows = requests[2]["updateDimensionProperties"];
    EXPECT_EQ(rows["range"]["dimension"], "ROWS");
    EXPECT_EQ(rows["range"]["endIndex"], 2);
    EXPECT_EQ(rows["properties"]["pixelSize"], 21);

    EXPECT_EQ(requests[3]["updateSheetProperties"]["properties"]["gridProperties"]["hideGridlines"], true);
}

TEST(BatchRequestsTest, ColumnWidthFollowsWidestLine) {
    EXPECT_EQ(column_pixel_width({ "short" }), 100);
    EXPECT_EQ(column_pixel_width({ std::string(20, 'x') }), 176);
    PlacementOptions options;
    options.px_per_char = 10;
    options.column_margin_px = 0;
    options.min_column_px = 0;
    EXPECT_EQ(column_pixel_width({ "═══ T ════" }, options), 100);
}

TEST(BatchRequestsTest, OptionsCanKeepGridlines) {
    PlacementOptions options;
    options.hide_gridlines = false;
    options.font_family = "Courier New";
    const json body = build_diagram_requests({ "x" }, 3, parse_a1("C1"), options);
    ASSERT_EQ(body["requests"].size(), 3u);
    EXPECT_EQ(body["requests"][0]["updateCells"]["rows"][0]["values"][0]["userEnteredFormat"]["textFormat"]["fontFamily"],
        "Courier New");
}

TEST(BatchRequestsTest, EmptyDiagramHasNoRequests) {
    const json body = build_diagram_requests({}, 0, parse_a1("A1"));
    ASSERT_TRUE(body.contains("requests"));
    EXPECT_TRUE(body["requests"].empty());
}
