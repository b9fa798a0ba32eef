#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sheet_placement {

class A1Error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Zero-based grid range. End indexes are exclusive; an absent end means the
// range is open in that dimension ("B:D" has no row bounds).
struct A1Range {
    std::optional<std::string> sheet_name;
    int start_row = 0;
    std::optional<int> end_row;
    int start_column = 0;
    std::optional<int> end_column;
};

// "A" -> 0, "Z" -> 25, "AA" -> 26. Case-insensitive.
int column_index(std::string_view letters);
std::string column_letters(int index);

// "A1" -> rows [0,1) cols [0,1); "A1:B5" -> rows [0,5) cols [0,2);
// "B:D" -> cols [1,4); "'My Sheet'!C3" carries the sheet name.
// Throws A1Error for anything else.
A1Range parse_a1(std::string_view notation);

} // namespace sheet_placement
