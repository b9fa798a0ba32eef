#pragma once

#include <diagram_model/types.hpp>
#include <sheet_placement/a1_notation.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace sheet_placement {

struct PlacementOptions {
    std::string font_family = "Roboto Mono";
    int px_per_char = 8;
    int column_margin_px = 16;
    int min_column_px = 100;
    int row_height_px = 21;
    bool hide_gridlines = true;
};

// Pixel width for the anchor column so the widest line fits.
int column_pixel_width(const diagram_model::Diagram& diagram, const PlacementOptions& options = {});

// Spreadsheet batchUpdate body placing one diagram line per row in the anchor
// column: cell values in a monospace font, column width, row heights and,
// optionally, hidden gridlines. Only the anchor's start row/column are used.
nlohmann::json build_diagram_requests(const diagram_model::Diagram& diagram,
    int sheet_id,
    const A1Range& anchor,
    const PlacementOptions& options = {});

} // namespace sheet_placement
