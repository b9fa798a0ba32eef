#pragma once

#include <diagram_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace diagram_render {

// Charts quantize each value against the dataset maximum into eighths of a cell,
// so bars grow in one-eighth steps. Empty datasets render nothing.

// Eighths filled by `value` on a scale of `cells` cells, in [0, cells * 8].
// A non-positive maximum or value fills nothing.
int bar_eighths(double value, double max_value, int cells);

// One line per datum: left-justified label, bar padded to `bar_width`, then the value.
diagram_model::Diagram render_bar_chart(const std::vector<diagram_model::BarDatum>& data,
    int bar_width = 20,
    bool show_values = true,
    std::optional<int> label_width = std::nullopt);

// Columns grow upwards over `bar_height` rows: optional value row, bar rows,
// baseline rule and label row. Each column is `bar_width` cells, `gap` apart.
diagram_model::Diagram render_vertical_bar_chart(const std::vector<diagram_model::BarDatum>& data,
    int bar_height = 8,
    int bar_width = 3,
    bool show_values = true,
    int gap = 1);

// Ramp index of `value` after min-max normalization; 4 for a zero-variance series.
int sparkline_index(double value, double min_value, double max_value);

// One glyph per value, optionally prefixed by "label ".
std::string render_sparkline(const std::vector<double>& values, const std::string& label = {});

// "[████░░░░]  50%". A non-positive max counts as 0% done.
std::string render_progress(double value,
    double max_value = 100,
    int width = 20,
    bool show_percent = true,
    const std::string& label = {});

// Integral values print without decimals, others with two; thousands are comma-grouped.
std::string format_value(double value);

} // namespace diagram_render
