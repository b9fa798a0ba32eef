#include <sheet_placement/batch_requests.hpp>
#include <glyphs/text_cells.hpp>
#include <algorithm>

namespace sheet_placement {

namespace {

using nlohmann::json;

json dimension_request(int sheet_id, const char* dimension, int start, int end, int pixels) {
    return { { "updateDimensionProperties", {
        { "range", { { "sheetId", sheet_id }, { "dimension", dimension },
                     { "startIndex", start }, { "endIndex", end } } },
        { "properties", { { "pixelSize", pixels } } },
        { "fields", "pixelSize" },
    } } };
}

} // namespace

int column_pixel_width(const diagram_model::Diagram& diagram, const PlacementOptions& options) {
    int widest = 0;
    for (const auto& line : diagram)
        widest = std::max(widest, glyphs::cell_width(line));
    return std::max(options.min_column_px, widest * options.px_per_char + options.column_margin_px);
}

json build_diagram_requests(const diagram_model::Diagram& diagram,
    int sheet_id,
    const A1Range& anchor,
    const PlacementOptions& options)
{
    json requests = json::array();
    if (diagram.empty()) return { { "requests", requests } };

    const int row = anchor.start_row;
    const int column = anchor.start_column;
    const int row_end = row + static_cast<int>(diagram.size());

    json rows = json::array();
    for (const auto& line : diagram) {
        rows.push_back({ { "values", json::array({ {
            { "userEnteredValue", { { "stringValue", line } } },
            { "userEnteredFormat", { { "textFormat", { { "fontFamily", options.font_family } } } } },
        } }) } });
    }

    requests.push_back({ { "updateCells", {
        { "range", { { "sheetId", sheet_id },
                     { "startRowIndex", row }, { "endRowIndex", row_end },
                     { "startColumnIndex", column }, { "endColumnIndex", column + 1 } } },
        { "rows", rows },
        { "fields", "userEnteredValue,userEnteredFormat.textFormat.fontFamily" },
    } } });

    requests.push_back(dimension_request(sheet_id, "COLUMNS", column, column + 1,
        column_pixel_width(diagram, options)));
    requests.push_back(dimension_request(sheet_id, "ROWS", row, row_end, options.row_height_px));

    if (options.hide_gridlines) {
        requests.push_back({ { "updateSheetProperties", {
            { "properties", { { "sheetId", sheet_id }, { "gridProperties", { { "hideGridlines", true } } } } },
            { "fields", "gridProperties.hideGridlines" },
        } } });
    }

    return { { "requests", requests } };
}

} // namespace sheet_placement
