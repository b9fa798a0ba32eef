#include <glyphs/text_cells.hpp>

namespace glyphs {

namespace {

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Byte offset just past the first `cells` code points of `text`.
std::size_t byte_offset_for_cells(std::string_view text, int cells) {
    std::size_t i = 0;
    int seen = 0;
    while (i < text.size()) {
        if (!is_continuation_byte(static_cast<unsigned char>(text[i]))) {
            if (seen == cells) break;
            ++seen;
        }
        ++i;
    }
    return i;
}

} // namespace

int cell_width(std::string_view text) {
    int n = 0;
    for (char c : text) {
        if (!is_continuation_byte(static_cast<unsigned char>(c)))
            ++n;
    }
    return n;
}

std::string repeat(std::string_view glyph, int count) {
    std::string out;
    if (count <= 0) return out;
    out.reserve(glyph.size() * static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i)
        out += glyph;
    return out;
}

std::string pad_right(std::string_view text, int width) {
    std::string out(text);
    const int missing = width - cell_width(text);
    if (missing > 0) out.append(static_cast<std::size_t>(missing), ' ');
    return out;
}

std::string truncate(std::string_view text, int width) {
    if (width <= 0) return {};
    return std::string(text.substr(0, byte_offset_for_cells(text, width)));
}

std::string fit(std::string_view text, int width) {
    return pad_right(truncate(text, width), width);
}

std::string center(std::string_view text, int width) {
    const int pad = width - cell_width(text);
    if (pad <= 0) return std::string(text);
    const int left = pad / 2;
    const int right = pad - left;
    std::string out;
    out.reserve(text.size() + static_cast<std::size_t>(pad));
    out.append(static_cast<std::size_t>(left), ' ');
    out += text;
    out.append(static_cast<std::size_t>(right), ' ');
    return out;
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace glyphs
