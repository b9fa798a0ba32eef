#include <glyphs/glyph_tables.hpp>

namespace glyphs {

namespace {

const BoxStyle light_box {
    "light",
    "─", "│",
    "┌", "┐", "└", "┘",
    "┬", "┴", "├", "┤", "┼",
};

const BoxStyle heavy_box {
    "heavy",
    "━", "┃",
    "┏", "┓", "┗", "┛",
    "┳", "┻", "┣", "┫", "╋",
};

const BoxStyle double_box {
    "double",
    "═", "║",
    "╔", "╗", "╚", "╝",
    "╦", "╩", "╠", "╣", "╬",
};

// Rounded corners share the light edges and junctions.
const BoxStyle rounded_box {
    "rounded",
    "─", "│",
    "╭", "╮", "╰", "╯",
    "┬", "┴", "├", "┤", "┼",
};

const BoxStyle* const all_styles[] = { &light_box, &heavy_box, &double_box, &rounded_box };

struct NamedPalette {
    std::string_view name;
    Palette chars;
};

const std::vector<NamedPalette>& palette_table() {
    static const std::vector<NamedPalette> table = {
        { "blocks", { " ", "░", "▒", "▓", "█" } },
        { "ascii", { " ", ".", ":", "-", "=", "+", "*", "#", "%", "@" } },
        { "dots", { " ", "⠁", "⠃", "⠇", "⠏", "⠟", "⠿", "⡿", "⣿" } },
        { "bars", { " ", "▁", "▂", "▃", "▄", "▅", "▆", "▇", "█" } },
        { "minimal", { " ", "·", "•", "●" } },
    };
    return table;
}

} // namespace

const BoxStyle& default_box_style() {
    return light_box;
}

const BoxStyle& box_style(std::string_view name) {
    for (const BoxStyle* style : all_styles) {
        if (style->name == name) return *style;
    }
    return light_box;
}

const std::vector<std::string_view>& box_style_names() {
    static const std::vector<std::string_view> names = [] {
        std::vector<std::string_view> out;
        for (const BoxStyle* style : all_styles)
            out.push_back(style->name);
        return out;
    }();
    return names;
}

const Palette& palette(std::string_view name) {
    const auto& table = palette_table();
    for (const auto& entry : table) {
        if (entry.name == name) return entry.chars;
    }
    return table.front().chars;
}

const std::vector<std::string_view>& palette_names() {
    static const std::vector<std::string_view> names = [] {
        std::vector<std::string_view> out;
        for (const auto& entry : palette_table())
            out.push_back(entry.name);
        return out;
    }();
    return names;
}

} // namespace glyphs
