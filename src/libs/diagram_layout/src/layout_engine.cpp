#include <diagram_layout/layout_engine.hpp>
#include <diagram_render/box_row.hpp>
#include <diagram_render/charts.hpp>
#include <diagram_render/gradient.hpp>
#include <diagram_render/renderer.hpp>
#include <diagram_render/table.hpp>
#include <glyphs/glyph_tables.hpp>
#include <glyphs/text_cells.hpp>
#include <algorithm>

namespace diagram_layout {

namespace {

using diagram_model::Diagram;

std::string indent(int cells) {
    return std::string(static_cast<std::size_t>(std::max(cells, 0)), ' ');
}

const diagram_model::Element* peek(const std::vector<diagram_model::Element>& elements, std::size_t i) {
    return i < elements.size() ? &elements[i] : nullptr;
}

bool is_down_arrow(const diagram_model::Element* element) {
    if (!element) return false;
    const auto* arrow = std::get_if<diagram_model::ArrowElement>(element);
    return arrow && arrow->direction == diagram_model::ArrowDirection::Down;
}

// One overload per element kind; std::visit rejects a variant alternative
// without a matching overload at compile time.
class ElementLayout {
public:
    ElementLayout(int inner_width, Diagram& out)
        : inner_width_(inner_width), out_(out) {}

    void set_next(const diagram_model::Element* next) { next_ = next; }

    void operator()(const diagram_model::TitleElement& e) {
        out_.push_back(diagram_render::render_title(e.text, inner_width_));
    }

    void operator()(const diagram_model::BoxElement& e) {
        const bool bottom = e.bottom_connector || is_down_arrow(next_);
        Diagram box = diagram_render::render_box(e.lines, e.width, layout::box_padding,
            e.top_connector, bottom);

        if (e.x != 0) {
            append(box, e.x);
            return;
        }

        if (!e.comment.empty() && !e.lines.empty())
            box[1 + e.lines.size() / 2] += diagram_render::render_comment(e.comment);

        const int box_width = diagram_render::box_total_width(e.lines, e.width, layout::box_padding);
        int offset = 0;
        if (box_width < inner_width_)
            offset = std::max(0, inner_width_ / 2 - box_width / 2);
        append(box, offset);
    }

    void operator()(const diagram_model::RowElement& e) {
        std::vector<std::vector<std::string>> contents;
        contents.reserve(e.boxes.size());
        for (const auto& b : e.boxes)
            contents.push_back(b.lines);

        Diagram row = diagram_render::render_box_row(contents, e.spacing, e.merge);
        const int row_width = diagram_width(row);
        const int offset = row_width < inner_width_ ? (inner_width_ - row_width) / 2 : 0;
        append(row, offset);
    }

    void operator()(const diagram_model::TextElement& e) {
        std::string line = indent(e.x) + e.text;
        if (!e.comment.empty())
            line += diagram_render::render_comment(e.comment);
        out_.push_back(std::move(line));
    }

    void operator()(const diagram_model::SpacerElement&) {
        out_.emplace_back();
    }

    void operator()(const diagram_model::ArrowElement& e) {
        const Diagram arrow = diagram_render::render_arrow(e.direction, e.length);
        const bool vertical = e.direction == diagram_model::ArrowDirection::Down
            || e.direction == diagram_model::ArrowDirection::Up;
        if (vertical && e.x == 0)
            append(arrow, layout::center_column(inner_width_));
        else
            append(arrow, e.x);
    }

    void operator()(const diagram_model::BarChartElement& e) {
        append(diagram_render::render_bar_chart(e.data, e.bar_width, e.show_values, e.label_width), e.x);
    }

    void operator()(const diagram_model::VerticalBarChartElement& e) {
        append(diagram_render::render_vertical_bar_chart(e.data, e.bar_height, e.bar_width,
            e.show_values, e.gap), e.x);
    }

    void operator()(const diagram_model::SparklineElement& e) {
        out_.push_back(indent(e.x) + diagram_render::render_sparkline(e.data, e.label));
    }

    void operator()(const diagram_model::ProgressElement& e) {
        out_.push_back(indent(e.x)
            + diagram_render::render_progress(e.value, e.max, e.width, e.show_percent, e.label));
    }

    void operator()(const diagram_model::ShadedBoxElement& e) {
        append(diagram_render::render_shaded_box(e.width, e.height, e.direction, e.palette,
            e.contrast, glyphs::box_style(e.box_style), e.title), e.x);
    }

    void operator()(const diagram_model::TableElement& e) {
        append(diagram_render::render_table(e.headers, e.rows, glyphs::box_style(e.box_style)), e.x);
    }

    void operator()(const diagram_model::UnknownElement&) {}

private:
    void append(const Diagram& lines, int offset) {
        const std::string pad = indent(offset);
        for (const auto& line : lines)
            out_.push_back(pad + line);
    }

    int inner_width_;
    Diagram& out_;
    const diagram_model::Element* next_ = nullptr;
};

} // namespace

Diagram layout_diagram(const std::vector<diagram_model::Element>& elements, int width, bool frame) {
    Diagram out;
    ElementLayout element_layout(layout::inner_width(width, frame), out);

    for (std::size_t i = 0; i < elements.size(); ++i) {
        element_layout.set_next(peek(elements, i + 1));
        std::visit(element_layout, elements[i]);
    }

    if (frame) return diagram_render::render_frame(out, width);
    return out;
}

Diagram layout_request(const diagram_model::DiagramRequest& request) {
    return layout_diagram(request.elements, request.width, request.frame);
}

std::string join_lines(const Diagram& diagram) {
    std::string text;
    for (std::size_t i = 0; i < diagram.size(); ++i) {
        if (i > 0) text += '\n';
        text += diagram[i];
    }
    return text;
}

int diagram_width(const Diagram& diagram) {
    int widest = 0;
    for (const auto& line : diagram)
        widest = std::max(widest, glyphs::cell_width(line));
    return widest;
}

} // namespace diagram_layout
