#include <diagram_render/table.hpp>
#include <glyphs/text_cells.hpp>
#include <algorithm>

namespace diagram_render {

namespace {

std::string rule_line(const glyphs::BoxStyle& style, const std::vector<int>& widths,
    std::string_view left, std::string_view junction, std::string_view right)
{
    std::string line(left);
    for (std::size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) line += junction;
        line += glyphs::repeat(style.horizontal, widths[i] + 2);
    }
    line += right;
    return line;
}

std::string cell_line(const glyphs::BoxStyle& style, const std::vector<int>& widths,
    const std::vector<std::string>& cells)
{
    std::string line(style.vertical);
    for (std::size_t i = 0; i < widths.size(); ++i) {
        const std::string empty;
        const std::string& cell = i < cells.size() ? cells[i] : empty;
        line += ' ';
        line += glyphs::pad_right(cell, widths[i]);
        line += ' ';
        line += style.vertical;
    }
    return line;
}

} // namespace

std::vector<int> table_column_widths(const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows)
{
    std::vector<int> widths;
    widths.reserve(headers.size());
    for (const auto& h : headers)
        widths.push_back(glyphs::cell_width(h));
    for (const auto& row : rows) {
        const std::size_t n = std::min(row.size(), widths.size());
        for (std::size_t i = 0; i < n; ++i)
            widths[i] = std::max(widths[i], glyphs::cell_width(row[i]));
    }
    return widths;
}

diagram_model::Diagram render_table(const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows,
    const glyphs::BoxStyle& style)
{
    diagram_model::Diagram out;
    if (headers.empty()) return out;

    const std::vector<int> widths = table_column_widths(headers, rows);
    out.reserve(rows.size() + 4);
    out.push_back(rule_line(style, widths, style.top_left, style.t_down, style.top_right));
    out.push_back(cell_line(style, widths, headers));
    out.push_back(rule_line(style, widths, style.t_right, style.cross, style.t_left));
    for (const auto& row : rows)
        out.push_back(cell_line(style, widths, row));
    out.push_back(rule_line(style, widths, style.bottom_left, style.t_up, style.bottom_right));
    return out;
}

} // namespace diagram_render
