#include <diagram_render/box_row.hpp>
#include <diagram_render/renderer.hpp>
#include <glyphs/glyph_tables.hpp>
#include <glyphs/text_cells.hpp>
#include <algorithm>
#include <string_view>

namespace diagram_render {

namespace {

std::string join_cells(const std::vector<std::string_view>& cells) {
    std::string line;
    for (auto c : cells)
        line += c;
    return line;
}

diagram_model::Diagram merge_lines(const std::vector<int>& centers) {
    const glyphs::BoxStyle& style = glyphs::default_box_style();
    const int left = centers.front();
    const int right = centers.back();
    const int mid = (left + right) / 2;

    std::vector<std::string_view> stems(static_cast<std::size_t>(right + 1), " ");
    for (int c : centers)
        stems[static_cast<std::size_t>(c)] = style.vertical;

    std::vector<std::string_view> run(static_cast<std::size_t>(right + 1), " ");
    for (int i = left; i <= right; ++i)
        run[static_cast<std::size_t>(i)] = style.horizontal;
    run[static_cast<std::size_t>(left)] = style.bottom_left;
    run[static_cast<std::size_t>(right)] = style.bottom_right;
    run[static_cast<std::size_t>(mid)] = style.t_down;

    return {
        join_cells(stems),
        join_cells(run),
        std::string(static_cast<std::size_t>(mid), ' ') + std::string(style.vertical),
    };
}

} // namespace

diagram_model::Diagram render_box_row(const std::vector<std::vector<std::string>>& boxes,
    int spacing,
    bool merge)
{
    diagram_model::Diagram out;
    if (boxes.empty()) return out;

    const glyphs::BoxStyle& style = glyphs::default_box_style();
    std::vector<diagram_model::Diagram> rendered;
    std::vector<int> widths;
    rendered.reserve(boxes.size());
    widths.reserve(boxes.size());
    std::size_t tallest = 0;
    for (const auto& content : boxes) {
        rendered.push_back(render_box(content));
        widths.push_back(box_total_width(content));
        tallest = std::max(tallest, rendered.back().size());
    }

    for (std::size_t i = 0; i < rendered.size(); ++i) {
        auto& box = rendered[i];
        if (box.size() >= tallest) continue;
        const std::string blank = std::string(style.vertical)
            + std::string(static_cast<std::size_t>(widths[i] - 2), ' ')
            + std::string(style.vertical);
        box.insert(box.end() - 1, tallest - box.size(), blank);
    }

    const std::string gap(static_cast<std::size_t>(std::max(spacing, 0)), ' ');
    out.reserve(tallest + 3);
    for (std::size_t row = 0; row < tallest; ++row) {
        std::string line;
        for (std::size_t i = 0; i < rendered.size(); ++i) {
            if (i > 0) line += gap;
            line += rendered[i][row];
        }
        out.push_back(std::move(line));
    }

    if (merge && boxes.size() >= 2) {
        std::vector<int> centers;
        centers.reserve(widths.size());
        int offset = 0;
        for (int w : widths) {
            centers.push_back(offset + w / 2);
            offset += w + std::max(spacing, 0);
        }
        for (auto& line : merge_lines(centers))
            out.push_back(std::move(line));
    }
    return out;
}

} // namespace diagram_render
