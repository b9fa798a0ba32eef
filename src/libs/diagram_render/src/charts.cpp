#include <diagram_render/charts.hpp>
#include <glyphs/glyph_tables.hpp>
#include <glyphs/text_cells.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>

namespace diagram_render {

namespace {

double max_value_of(const std::vector<diagram_model::BarDatum>& data) {
    double max_value = data.front().value;
    for (const auto& d : data)
        max_value = std::max(max_value, d.value);
    return max_value;
}

// Centered in `width` cells, cut when it does not fit.
std::string column_cell(const std::string& text, int width) {
    return glyphs::fit(glyphs::center(text, width), width);
}

std::string join_columns(const std::vector<std::string>& cells, int gap) {
    const std::string spacer(static_cast<std::size_t>(gap), ' ');
    std::string line;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i > 0) line += spacer;
        line += cells[i];
    }
    return line;
}

} // namespace

int bar_eighths(double value, double max_value, int cells) {
    if (max_value <= 0 || value <= 0 || cells <= 0) return 0;
    const int total = cells * 8;
    const int eighths = static_cast<int>(value / max_value * total);
    return std::clamp(eighths, 0, total);
}

diagram_model::Diagram render_bar_chart(const std::vector<diagram_model::BarDatum>& data,
    int bar_width,
    bool show_values,
    std::optional<int> label_width)
{
    diagram_model::Diagram out;
    if (data.empty()) return out;

    const double max_value = max_value_of(data);
    int labels = 0;
    if (label_width) {
        labels = *label_width;
    } else {
        for (const auto& d : data)
            labels = std::max(labels, glyphs::cell_width(d.label));
    }

    for (const auto& d : data) {
        const int eighths = bar_eighths(d.value, max_value, bar_width);
        std::string bar = glyphs::repeat(glyphs::full_block, eighths / 8);
        const int remainder = eighths % 8;
        if (remainder > 0)
            bar += glyphs::fill_ramp[static_cast<std::size_t>(8 - remainder)];

        std::string line = glyphs::pad_right(d.label, labels);
        line += ' ';
        line += glyphs::pad_right(bar, bar_width);
        if (show_values) {
            line += ' ';
            line += format_value(d.value);
        }
        out.push_back(std::move(line));
    }
    return out;
}

diagram_model::Diagram render_vertical_bar_chart(const std::vector<diagram_model::BarDatum>& data,
    int bar_height,
    int bar_width,
    bool show_values,
    int gap)
{
    diagram_model::Diagram out;
    if (data.empty()) return out;
    bar_width = std::max(bar_width, 0);
    gap = std::max(gap, 0);

    const double max_value = max_value_of(data);
    std::vector<int> eighths;
    eighths.reserve(data.size());
    for (const auto& d : data)
        eighths.push_back(bar_eighths(d.value, max_value, bar_height));

    std::vector<std::string> cells(data.size());

    if (show_values) {
        for (std::size_t i = 0; i < data.size(); ++i)
            cells[i] = column_cell(format_value(data[i].value), bar_width);
        out.push_back(join_columns(cells, gap));
    }

    for (int row = bar_height; row >= 1; --row) {
        const int row_floor = (row - 1) * 8;
        for (std::size_t i = 0; i < data.size(); ++i) {
            const int e = eighths[i];
            if (e >= row * 8) {
                cells[i] = glyphs::repeat(glyphs::full_block, bar_width);
            } else if (e > row_floor) {
                const int partial = e - row_floor;
                cells[i] = glyphs::repeat(glyphs::spark_ramp[static_cast<std::size_t>(partial - 1)], bar_width);
            } else {
                cells[i] = std::string(static_cast<std::size_t>(bar_width), ' ');
            }
        }
        out.push_back(join_columns(cells, gap));
    }

    const int count = static_cast<int>(data.size());
    const int chart_width = count * bar_width + (count - 1) * gap;
    out.push_back(glyphs::repeat(glyphs::default_box_style().horizontal, chart_width));

    for (std::size_t i = 0; i < data.size(); ++i)
        cells[i] = column_cell(data[i].label, bar_width);
    out.push_back(join_columns(cells, gap));
    return out;
}

int sparkline_index(double value, double min_value, double max_value) {
    if (max_value <= min_value) return 4;
    const int idx = static_cast<int>(std::floor((value - min_value) / (max_value - min_value) * 7));
    return std::clamp(idx, 0, 7);
}

std::string render_sparkline(const std::vector<double>& values, const std::string& label) {
    std::string out;
    if (!label.empty()) {
        out += label;
        out += ' ';
    }
    if (values.empty()) return out;

    const auto [lo, hi] = std::minmax_element(values.begin(), values.end());
    for (double v : values)
        out += glyphs::spark_ramp[static_cast<std::size_t>(sparkline_index(v, *lo, *hi))];
    return out;
}

std::string render_progress(double value,
    double max_value,
    int width,
    bool show_percent,
    const std::string& label)
{
    const double ratio = max_value > 0 ? std::clamp(value / max_value, 0.0, 1.0) : 0.0;
    const int cells = std::max(width, 0);
    const int filled = std::min(static_cast<int>(std::floor(ratio * cells)), cells);

    std::string out;
    if (!label.empty()) {
        out += label;
        out += ' ';
    }
    out += '[';
    out += glyphs::repeat(glyphs::full_block, filled);
    out += glyphs::repeat(glyphs::light_shade, cells - filled);
    out += ']';
    if (show_percent) {
        // Half-way percentages round to even.
        const int percent = static_cast<int>(std::nearbyint(ratio * 100.0));
        out += fmt::format(" {:>3}%", percent);
    }
    return out;
}

std::string format_value(double value) {
    const bool whole = std::isfinite(value) && value == std::floor(value);
    std::string text = whole ? fmt::format("{:.0f}", value) : fmt::format("{:.2f}", value);
    if (!std::isfinite(value)) return text;

    const std::size_t digits_begin = (!text.empty() && text[0] == '-') ? 1 : 0;
    std::size_t digits_end = text.find('.');
    if (digits_end == std::string::npos) digits_end = text.size();

    for (std::size_t pos = digits_end; pos > digits_begin + 3; pos -= 3)
        text.insert(pos - 3, 1, ',');
    return text;
}

} // namespace diagram_render
