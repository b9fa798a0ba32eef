#include <sheet_placement/a1_notation.hpp>
#include <cctype>

namespace sheet_placement {

namespace {

struct CellRef {
    std::string_view letters;
    std::string_view digits;
};

CellRef split_cell(std::string_view cell, std::string_view whole) {
    std::size_t i = 0;
    while (i < cell.size() && std::isalpha(static_cast<unsigned char>(cell[i])))
        ++i;
    std::size_t j = i;
    while (j < cell.size() && std::isdigit(static_cast<unsigned char>(cell[j])))
        ++j;
    if (j != cell.size())
        throw A1Error("Invalid A1 notation: " + std::string(whole));
    return { cell.substr(0, i), cell.substr(i, j - i) };
}

int parse_row(std::string_view digits, std::string_view whole) {
    int row = 0;
    for (char c : digits) {
        row = row * 10 + (c - '0');
        if (row > 10'000'000) throw A1Error("Row out of range: " + std::string(whole));
    }
    if (row == 0) throw A1Error("Rows start at 1: " + std::string(whole));
    return row;
}

} // namespace

int column_index(std::string_view letters) {
    if (letters.empty()) throw A1Error("Empty column reference");
    int result = 0;
    for (char c : letters) {
        if (!std::isalpha(static_cast<unsigned char>(c)))
            throw A1Error("Invalid column reference: " + std::string(letters));
        result = result * 26 + (std::toupper(static_cast<unsigned char>(c)) - 'A' + 1);
        if (result > 1'000'000) throw A1Error("Column out of range: " + std::string(letters));
    }
    return result - 1;
}

std::string column_letters(int index) {
    if (index < 0) throw A1Error("Negative column index");
    std::string out;
    for (int n = index + 1; n > 0; n = (n - 1) / 26)
        out.insert(out.begin(), static_cast<char>('A' + (n - 1) % 26));
    return out;
}

A1Range parse_a1(std::string_view notation) {
    A1Range range;
    std::string_view cells = notation;

    const std::size_t bang = notation.rfind('!');
    if (bang != std::string_view::npos) {
        std::string_view sheet = notation.substr(0, bang);
        if (sheet.size() >= 2 && sheet.front() == '\'' && sheet.back() == '\'')
            sheet = sheet.substr(1, sheet.size() - 2);
        range.sheet_name = std::string(sheet);
        cells = notation.substr(bang + 1);
    }

    std::string_view start = cells;
    std::string_view end = cells;
    const std::size_t colon = cells.find(':');
    if (colon != std::string_view::npos) {
        start = cells.substr(0, colon);
        end = cells.substr(colon + 1);
    }

    const CellRef s = split_cell(start, notation);
    const CellRef e = split_cell(end, notation);
    if (s.letters.empty() && s.digits.empty() && e.letters.empty() && e.digits.empty())
        throw A1Error("Invalid A1 notation: " + std::string(notation));

    range.start_row = s.digits.empty() ? 0 : parse_row(s.digits, notation) - 1;
    if (!e.digits.empty()) range.end_row = parse_row(e.digits, notation);
    range.start_column = s.letters.empty() ? 0 : column_index(s.letters);
    if (!e.letters.empty()) range.end_column = column_index(e.letters) + 1;
    return range;
}

} // namespace sheet_placement
