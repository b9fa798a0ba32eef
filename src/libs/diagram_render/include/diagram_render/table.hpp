#pragma once

#include <diagram_model/types.hpp>
#include <glyphs/glyph_tables.hpp>
#include <string>
#include <vector>

namespace diagram_render {

// Per column: the widest of the header and every cell in that position.
// Cells beyond the header count are ignored.
std::vector<int> table_column_widths(const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows);

// Top border, header row, separator, data rows, bottom border. Cells are
// left-justified with one space of padding each side; short rows get empty cells.
diagram_model::Diagram render_table(const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows,
    const glyphs::BoxStyle& style = glyphs::default_box_style());

} // namespace diagram_render
