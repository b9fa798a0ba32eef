#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace glyphs {

// Text is UTF-8. One code point occupies one monospace cell; all widths below
// are measured in cells, not bytes.

int cell_width(std::string_view text);

// `glyph` repeated `count` times; non-positive counts give an empty string.
std::string repeat(std::string_view glyph, int count);

// Left-justify: pad with trailing spaces up to `width` cells. Never truncates.
std::string pad_right(std::string_view text, int width);

// Keep at most `width` cells.
std::string truncate(std::string_view text, int width);

// Pad or truncate to exactly `width` cells.
std::string fit(std::string_view text, int width);

// Center inside `width` cells. The left gap gets floor(pad / 2) spaces and the
// right gap the remainder. Text wider than `width` is returned unchanged.
std::string center(std::string_view text, int width);

// Split on '\n'. An empty input yields a single empty line.
std::vector<std::string> split_lines(std::string_view text);

} // namespace glyphs
