#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace diagram_model {

// One rendered text row. A Diagram is the ordered top-to-bottom list of rows.
using Line = std::string;
using Diagram = std::vector<Line>;

enum class ArrowDirection { Down, Up, Left, Right };

enum class ShadeDirection { Horizontal, Vertical, Radial, Diagonal, DiagonalReverse };

struct TitleElement {
    std::string text;
};

struct BoxElement {
    std::vector<std::string> lines;
    int x = 0;                      // 0 = centered in the diagram width
    std::optional<int> width;       // explicit total width, borders included
    std::string comment;
    bool top_connector = false;
    bool bottom_connector = false;
};

struct RowBox {
    std::vector<std::string> lines;
};

struct RowElement {
    std::vector<RowBox> boxes;
    int spacing = 2;
    bool merge = false;
};

struct TextElement {
    std::string text;
    int x = 0;
    std::string comment;
};

struct SpacerElement {};

struct ArrowElement {
    ArrowDirection direction = ArrowDirection::Down;
    int length = 1;
    int x = 0;                      // 0 = centered (vertical arrows only)
};

struct BarDatum {
    std::string label;
    double value = 0;
};

struct BarChartElement {
    std::vector<BarDatum> data;
    int bar_width = 20;
    bool show_values = true;
    std::optional<int> label_width; // defaults to the longest label
    int x = 0;
};

struct VerticalBarChartElement {
    std::vector<BarDatum> data;
    int bar_height = 8;
    int bar_width = 3;
    bool show_values = true;
    int gap = 1;
    int x = 0;
};

struct SparklineElement {
    std::vector<double> data;
    std::string label;
    int x = 0;
};

struct ProgressElement {
    double value = 0;
    double max = 100;
    int width = 20;
    bool show_percent = true;
    std::string label;
    int x = 0;
};

struct ShadedBoxElement {
    int width = 20;                 // shaded interior, borders excluded
    int height = 6;
    std::string title;
    std::string palette = "blocks";
    ShadeDirection direction = ShadeDirection::Horizontal;
    double contrast = 0.5;
    std::string box_style = "light";
    int x = 0;
};

struct TableElement {
    std::vector<std::string> headers;
    std::vector<std::vector<std::string>> rows;
    std::string box_style = "light";
    int x = 0;
};

// Element whose type tag was not recognized when decoded. Renders nothing.
struct UnknownElement {
    std::string type;
};

using Element = std::variant<
    TitleElement,
    BoxElement,
    RowElement,
    TextElement,
    SpacerElement,
    ArrowElement,
    BarChartElement,
    VerticalBarChartElement,
    SparklineElement,
    ProgressElement,
    ShadedBoxElement,
    TableElement,
    UnknownElement>;

struct DiagramRequest {
    std::vector<Element> elements;
    int width = 60;
    bool frame = false;
    bool strict = false;
};

} // namespace diagram_model
