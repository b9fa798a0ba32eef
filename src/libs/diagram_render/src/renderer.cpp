#include <diagram_render/renderer.hpp>
#include <glyphs/text_cells.hpp>
#include <algorithm>

namespace diagram_render {

namespace {

// Border of `total` cells; with a connector the tee sits after floor((total - 3) / 2)
// edge glyphs and the right run takes the remainder.
std::string border_line(std::string_view left, std::string_view tee, std::string_view right,
    std::string_view edge, int total, bool connector)
{
    std::string line(left);
    if (connector && total >= 3) {
        const int half = (total - 3) / 2;
        const int remainder = (total - 3) - half;
        line += glyphs::repeat(edge, half);
        line += tee;
        line += glyphs::repeat(edge, remainder);
    } else {
        line += glyphs::repeat(edge, total - 2);
    }
    line += right;
    return line;
}

int longest_line(const std::vector<std::string>& content) {
    int longest = 0;
    for (const auto& line : content)
        longest = std::max(longest, glyphs::cell_width(line));
    return longest;
}

int inner_width_for(const std::vector<std::string>& content, std::optional<int> width, int padding) {
    const int longest = longest_line(content);
    if (!width) return longest;
    // Content never overflows the border, even under a too-small explicit width.
    return std::max(*width - 2 - 2 * padding, longest);
}

} // namespace

int box_total_width(const std::vector<std::string>& content, std::optional<int> width, int padding) {
    return inner_width_for(content, width, padding) + 2 + 2 * padding;
}

diagram_model::Diagram render_box(const std::vector<std::string>& content,
    std::optional<int> width,
    int padding,
    bool top_connector,
    bool bottom_connector,
    const glyphs::BoxStyle& style)
{
    const int inner = inner_width_for(content, width, padding);
    const int total = inner + 2 + 2 * padding;
    const std::string side_pad(static_cast<std::size_t>(std::max(padding, 0)), ' ');

    diagram_model::Diagram out;
    out.reserve(content.size() + 2);
    out.push_back(border_line(style.top_left, style.t_down, style.top_right,
        style.horizontal, total, top_connector));
    for (const auto& line : content) {
        std::string row(style.vertical);
        row += side_pad;
        row += glyphs::center(line, inner);
        row += side_pad;
        row += style.vertical;
        out.push_back(std::move(row));
    }
    out.push_back(border_line(style.bottom_left, style.t_up, style.bottom_right,
        style.horizontal, total, bottom_connector));
    return out;
}

std::string render_title(const std::string& text, int width) {
    const std::string label = " " + text + " ";
    const int pad = width - glyphs::cell_width(label);
    if (pad <= 0) return label;
    const int left = pad / 2;
    return glyphs::repeat(glyphs::title_fill, left) + label + glyphs::repeat(glyphs::title_fill, pad - left);
}

diagram_model::Diagram render_frame(const diagram_model::Diagram& content, int width) {
    // Border, blank, blank, border: narrower frames are drawn at this width.
    const int frame_width = std::max(width, 4);
    const int inner = frame_width - 4;
    const int edge = frame_width - 2;

    auto framed = [&](const std::string& line) {
        std::string row(glyphs::frame::vertical);
        row += ' ';
        row += glyphs::fit(line, inner);
        row += ' ';
        row += glyphs::frame::vertical;
        return row;
    };

    diagram_model::Diagram out;
    out.reserve(content.size() + 4);
    out.push_back(std::string(glyphs::frame::top_left)
        + glyphs::repeat(glyphs::frame::horizontal, edge)
        + std::string(glyphs::frame::top_right));
    out.push_back(framed({}));
    for (const auto& line : content)
        out.push_back(framed(line));
    out.push_back(framed({}));
    out.push_back(std::string(glyphs::frame::bottom_left)
        + glyphs::repeat(glyphs::frame::horizontal, edge)
        + std::string(glyphs::frame::bottom_right));
    return out;
}

std::string render_comment(const std::string& comment) {
    return std::string(glyphs::comment_marker) + comment;
}

diagram_model::Diagram render_arrow(diagram_model::ArrowDirection direction, int length) {
    using diagram_model::ArrowDirection;
    const int shaft = std::max(length, 0);
    diagram_model::Diagram out;

    switch (direction) {
    case ArrowDirection::Down:
        for (int i = 0; i < shaft; ++i)
            out.emplace_back(glyphs::arrows::vertical);
        out.emplace_back(glyphs::arrows::down);
        break;
    case ArrowDirection::Up:
        out.emplace_back(glyphs::arrows::up);
        for (int i = 0; i < shaft; ++i)
            out.emplace_back(glyphs::arrows::vertical);
        break;
    case ArrowDirection::Left:
        out.push_back(std::string(glyphs::arrows::left) + glyphs::repeat(glyphs::arrows::horizontal, shaft));
        break;
    case ArrowDirection::Right:
        out.push_back(glyphs::repeat(glyphs::arrows::horizontal, shaft) + std::string(glyphs::arrows::right));
        break;
    }
    return out;
}

} // namespace diagram_render
