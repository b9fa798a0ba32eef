#include <diagram_loaders/json_loader.hpp>
#include <diagram_layout/layout_constants.hpp>
#include <glyphs/text_cells.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace diagram_loaders {

namespace {

using nlohmann::json;

class RequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[noreturn]] void fail(std::size_t index, const std::string& type, const std::string& what) {
    throw RequestError("element " + std::to_string(index) + " (" + type + "): " + what);
}

std::string get_string(const json& j, const char* key, const std::string& fallback = {}) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

// Whole number in [lo, hi]. Fractions, overflow and out-of-range values give std::nullopt.
std::optional<int> int_in_range(const json& v, int lo, int hi) {
    if (!v.is_number()) return std::nullopt;
    const double d = v.get<double>();
    if (!std::isfinite(d) || d != std::floor(d) || d < lo || d > hi) return std::nullopt;
    return static_cast<int>(d);
}

// Sizes, offsets and spacings. Absent or non-numeric keeps `fallback`.
int get_int(const json& j, const char* key, int fallback, std::size_t index, const std::string& type) {
    if (!j.contains(key) || !j[key].is_number()) return fallback;
    const std::optional<int> value = int_in_range(j[key], 0, diagram_layout::layout::max_extent);
    if (!value) {
        fail(index, type, "'" + std::string(key) + "' must be an integer in [0, "
            + std::to_string(diagram_layout::layout::max_extent) + "]");
    }
    return *value;
}

double get_double(const json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

bool get_bool(const json& j, const char* key, bool fallback) {
    return j.contains(key) && j[key].is_boolean() ? j[key].get<bool>() : fallback;
}

// Cells and labels may be given as numbers; they are shown as JSON prints them.
std::string as_text(const json& v) {
    return v.is_string() ? v.get<std::string>() : v.dump();
}

diagram_model::ArrowDirection arrow_direction_from_string(const std::string& s) {
    if (s == "down") return diagram_model::ArrowDirection::Down;
    if (s == "up") return diagram_model::ArrowDirection::Up;
    if (s == "left") return diagram_model::ArrowDirection::Left;
    return diagram_model::ArrowDirection::Right;
}

diagram_model::ShadeDirection shade_direction_from_string(const std::string& s) {
    if (s == "vertical") return diagram_model::ShadeDirection::Vertical;
    if (s == "radial") return diagram_model::ShadeDirection::Radial;
    if (s == "diagonal") return diagram_model::ShadeDirection::Diagonal;
    if (s == "diagonal_reverse") return diagram_model::ShadeDirection::DiagonalReverse;
    return diagram_model::ShadeDirection::Horizontal;
}

// "lines": [..] wins over "text": "a\nb".
std::optional<std::vector<std::string>> parse_lines(const json& j) {
    if (j.contains("lines") && j["lines"].is_array()) {
        std::vector<std::string> lines;
        for (const auto& l : j["lines"])
            lines.push_back(as_text(l));
        return lines;
    }
    if (j.contains("text") && !j["text"].is_null() && !j["text"].is_array() && !j["text"].is_object())
        return glyphs::split_lines(as_text(j["text"]));
    return std::nullopt;
}

std::vector<diagram_model::BarDatum> parse_bar_data(const json& j, std::size_t index, const std::string& type) {
    if (!j.contains("data") || !j["data"].is_array()) fail(index, type, "missing 'data' array");

    std::vector<diagram_model::BarDatum> data;
    for (const auto& d : j["data"]) {
        diagram_model::BarDatum datum;
        if (d.is_array() && d.size() >= 2 && d[1].is_number()) {
            datum.label = as_text(d[0]);
            datum.value = d[1].get<double>();
        } else if (d.is_object() && d.contains("value") && d["value"].is_number()) {
            datum.label = d.contains("label") ? as_text(d["label"]) : "";
            datum.value = d["value"].get<double>();
        } else {
            fail(index, type, "each data entry must be [label, value] or {\"label\", \"value\"}");
        }
        data.push_back(std::move(datum));
    }
    return data;
}

diagram_model::Element parse_element(const json& e, std::size_t index, bool strict) {
    if (!e.is_object()) fail(index, "?", "element must be an object");
    if (!e.contains("type") || !e["type"].is_string()) fail(index, "?", "missing 'type'");
    const std::string type = e["type"].get<std::string>();

    if (type == "title") {
        if (!e.contains("text")) fail(index, type, "missing 'text'");
        return diagram_model::TitleElement{ as_text(e["text"]) };
    }

    if (type == "box") {
        diagram_model::BoxElement box;
        auto lines = parse_lines(e);
        if (!lines) fail(index, type, "missing 'text' or 'lines'");
        box.lines = std::move(*lines);
        box.x = get_int(e, "x", 0, index, type);
        if (e.contains("width") && e["width"].is_number()) box.width = get_int(e, "width", 0, index, type);
        box.comment = get_string(e, "comment");
        box.top_connector = get_bool(e, "top_connector", false);
        box.bottom_connector = get_bool(e, "bottom_connector", false);
        return box;
    }

    if (type == "row") {
        if (!e.contains("boxes") || !e["boxes"].is_array()) fail(index, type, "missing 'boxes' array");
        diagram_model::RowElement row;
        for (const auto& b : e["boxes"]) {
            diagram_model::RowBox rb;
            if (b.is_string()) {
                rb.lines = glyphs::split_lines(b.get<std::string>());
            } else {
                auto lines = b.is_object() ? parse_lines(b) : std::nullopt;
                if (!lines) fail(index, type, "each box needs 'text' or 'lines'");
                rb.lines = std::move(*lines);
            }
            row.boxes.push_back(std::move(rb));
        }
        row.spacing = get_int(e, "spacing", row.spacing, index, type);
        row.merge = get_bool(e, "merge", false);
        return row;
    }

    if (type == "text") {
        if (!e.contains("text")) fail(index, type, "missing 'text'");
        diagram_model::TextElement text;
        text.text = as_text(e["text"]);
        text.x = get_int(e, "x", 0, index, type);
        text.comment = get_string(e, "comment");
        return text;
    }

    if (type == "spacer") return diagram_model::SpacerElement{};

    if (type == "arrow") {
        diagram_model::ArrowElement arrow;
        arrow.direction = arrow_direction_from_string(get_string(e, "direction", "down"));
        arrow.length = get_int(e, "length", arrow.length, index, type);
        arrow.x = get_int(e, "x", 0, index, type);
        return arrow;
    }

    if (type == "bar_chart") {
        diagram_model::BarChartElement chart;
        chart.data = parse_bar_data(e, index, type);
        chart.bar_width = get_int(e, "bar_width", chart.bar_width, index, type);
        chart.show_values = get_bool(e, "show_values", chart.show_values);
        if (e.contains("label_width") && e["label_width"].is_number())
            chart.label_width = get_int(e, "label_width", 0, index, type);
        chart.x = get_int(e, "x", 0, index, type);
        return chart;
    }

    if (type == "bar_chart_vertical") {
        diagram_model::VerticalBarChartElement chart;
        chart.data = parse_bar_data(e, index, type);
        chart.bar_height = get_int(e, "bar_height", chart.bar_height, index, type);
        chart.bar_width = get_int(e, "bar_width", chart.bar_width, index, type);
        chart.show_values = get_bool(e, "show_values", chart.show_values);
        chart.gap = get_int(e, "gap", chart.gap, index, type);
        chart.x = get_int(e, "x", 0, index, type);
        return chart;
    }

    if (type == "sparkline") {
        if (!e.contains("data") || !e["data"].is_array()) fail(index, type, "missing 'data' array");
        diagram_model::SparklineElement spark;
        for (const auto& v : e["data"]) {
            if (!v.is_number()) fail(index, type, "'data' must contain only numbers");
            spark.data.push_back(v.get<double>());
        }
        spark.label = get_string(e, "label");
        spark.x = get_int(e, "x", 0, index, type);
        return spark;
    }

    if (type == "progress") {
        if (!e.contains("value") || !e["value"].is_number()) fail(index, type, "missing numeric 'value'");
        diagram_model::ProgressElement progress;
        progress.value = e["value"].get<double>();
        progress.max = get_double(e, "max", progress.max);
        progress.width = get_int(e, "width", progress.width, index, type);
        progress.show_percent = get_bool(e, "show_percent", progress.show_percent);
        progress.label = get_string(e, "label");
        progress.x = get_int(e, "x", 0, index, type);
        return progress;
    }

    if (type == "shaded_box") {
        diagram_model::ShadedBoxElement shaded;
        shaded.width = get_int(e, "width", shaded.width, index, type);
        shaded.height = get_int(e, "height", shaded.height, index, type);
        shaded.title = get_string(e, "title");
        shaded.palette = get_string(e, "palette", shaded.palette);
        shaded.direction = shade_direction_from_string(get_string(e, "direction", "horizontal"));
        shaded.contrast = get_double(e, "contrast", shaded.contrast);
        shaded.box_style = get_string(e, "box_style", shaded.box_style);
        shaded.x = get_int(e, "x", 0, index, type);
        return shaded;
    }

    if (type == "table") {
        if (!e.contains("headers") || !e["headers"].is_array()) fail(index, type, "missing 'headers' array");
        if (!e.contains("rows") || !e["rows"].is_array()) fail(index, type, "missing 'rows' array");
        diagram_model::TableElement table;
        for (const auto& h : e["headers"])
            table.headers.push_back(as_text(h));
        for (const auto& r : e["rows"]) {
            if (!r.is_array()) fail(index, type, "each row must be an array");
            std::vector<std::string> cells;
            for (const auto& c : r)
                cells.push_back(as_text(c));
            table.rows.push_back(std::move(cells));
        }
        table.box_style = get_string(e, "box_style", table.box_style);
        table.x = get_int(e, "x", 0, index, type);
        return table;
    }

    if (strict) fail(index, type, "unknown element type");
    spdlog::debug("element {} has unknown type '{}' and will render nothing", index, type);
    return diagram_model::UnknownElement{ type };
}

diagram_model::DiagramRequest parse_request(const json& j, bool strict) {
    diagram_model::DiagramRequest request;
    const json* elements = nullptr;

    if (j.is_array()) {
        elements = &j;
    } else if (j.is_object()) {
        if (!j.contains("elements") || !j["elements"].is_array())
            throw RequestError("missing 'elements' array");
        elements = &j["elements"];
        if (j.contains("width") && j["width"].is_number()) {
            const std::optional<int> width = int_in_range(j["width"],
                diagram_layout::layout::min_width, diagram_layout::layout::max_width);
            if (!width) {
                throw RequestError("'width' must be an integer in ["
                    + std::to_string(diagram_layout::layout::min_width) + ", "
                    + std::to_string(diagram_layout::layout::max_width) + "]");
            }
            request.width = *width;
        }
        request.frame = get_bool(j, "frame", request.frame);
        request.strict = get_bool(j, "strict", request.strict);
    } else {
        throw RequestError("request must be an object or an array of elements");
    }

    request.strict = request.strict || strict;

    for (std::size_t i = 0; i < elements->size(); ++i)
        request.elements.push_back(parse_element((*elements)[i], i, request.strict));
    return request;
}

std::optional<diagram_model::DiagramRequest> reject(const std::string& message, std::string* error) {
    spdlog::warn("rejected diagram request: {}", message);
    if (error) *error = message;
    return std::nullopt;
}

} // namespace

std::optional<diagram_model::DiagramRequest> load_request_from_json(std::istream& in,
    std::string* error, bool strict)
{
    try {
        json j = json::parse(in);
        return parse_request(j, strict);
    } catch (const json::exception& e) {
        return reject(std::string("invalid JSON: ") + e.what(), error);
    } catch (const RequestError& e) {
        return reject(e.what(), error);
    }
}

std::optional<diagram_model::DiagramRequest> load_request_from_json_string(const std::string& text,
    std::string* error, bool strict)
{
    std::istringstream in(text);
    return load_request_from_json(in, error, strict);
}

std::optional<diagram_model::DiagramRequest> load_request_from_json_file(const std::string& path,
    std::string* error, bool strict)
{
    std::ifstream f(path);
    if (!f) return reject("cannot open " + path, error);
    return load_request_from_json(f, error, strict);
}

} // namespace diagram_loaders
