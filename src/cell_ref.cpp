#include "cell_ref.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace util {

std::optional<std::uint32_t> parse_column(const std::string &letters) {
    if (letters.empty() || letters.size() > 3) return std::nullopt;
    std::uint32_t n = 0;
    for (unsigned char c : letters) {
        if (!std::isalpha(c)) return std::nullopt;
        n = n * 26 + static_cast<std::uint32_t>(std::toupper(c) - 'A' + 1);
    }
    if (n > kMaxCols) return std::nullopt;
    return n - 1;
}

std::optional<CellRef> parse_cell_ref(const std::string &a1) {
    std::string letters, digits;
    std::size_t i = 0;
    if (i < a1.size() && a1[i] == '$') ++i;
    while (i < a1.size() && std::isalpha(static_cast<unsigned char>(a1[i]))) letters.push_back(a1[i++]);
    if (i < a1.size() && a1[i] == '$') ++i;
    while (i < a1.size() && std::isdigit(static_cast<unsigned char>(a1[i]))) digits.push_back(a1[i++]);
    if (i != a1.size() || digits.empty() || digits.size() > 7) return std::nullopt;

    auto col = parse_column(letters);
    if (!col) return std::nullopt;
    const unsigned long row = std::stoul(digits);
    if (row == 0 || row > kMaxRows) return std::nullopt;
    return CellRef{static_cast<std::uint32_t>(row - 1), *col};
}

std::string column_letters(std::uint32_t col) {
    std::string out;
    std::uint32_t n = col + 1;
    while (n > 0) {
        const std::uint32_t rem = (n - 1) % 26;
        out.insert(out.begin(), static_cast<char>('A' + rem));
        n = (n - 1) / 26;
    }
    return out;
}

std::string to_a1(const CellRef &ref) {
    return column_letters(ref.col) + std::to_string(ref.row + 1);
}

namespace {

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

// Reads [$]letters[$]digits at `i`; fills the parts and returns the end offset, or `i` when no reference starts there.
std::size_t scan_ref(const std::string &f, std::size_t i, bool &colAbs, std::string &letters,
                     bool &rowAbs, std::string &digits) {
    std::size_t j = i;
    colAbs = j < f.size() && f[j] == '$';
    if (colAbs) ++j;
    const std::size_t l0 = j;
    while (j < f.size() && std::isalpha(static_cast<unsigned char>(f[j]))) ++j;
    if (j == l0 || j - l0 > 3) return i;
    letters = f.substr(l0, j - l0);
    rowAbs = j < f.size() && f[j] == '$';
    if (rowAbs) ++j;
    const std::size_t d0 = j;
    while (j < f.size() && std::isdigit(static_cast<unsigned char>(f[j]))) ++j;
    if (j == d0) return i;
    digits = f.substr(d0, j - d0);
    // LOG10( is a function and Sheet1A2x is a name, not references.
    if (j < f.size() && (is_name_char(f[j]) || f[j] == '(')) return i;
    return j;
}

} // namespace

std::string shift_formula(const std::string &formula, std::int64_t rows, std::int64_t cols) {
    std::string out;
    std::size_t i = 0;
    while (i < formula.size()) {
        const char c = formula[i];
        if (c == '"' || c == '\'') {
            // Quoted text; a doubled quote stands for itself.
            std::size_t j = i + 1;
            while (j < formula.size()) {
                if (formula[j] == c) {
                    if (j + 1 < formula.size() && formula[j + 1] == c) {
                        j += 2;
                        continue;
                    }
                    break;
                }
                ++j;
            }
            const std::size_t end = std::min(j + 1, formula.size());
            out.append(formula, i, end - i);
            i = end;
            continue;
        }

        const bool boundary = i == 0 || !is_name_char(formula[i - 1]);
        bool colAbs = false, rowAbs = false;
        std::string letters, digits;
        const std::size_t end = boundary ? scan_ref(formula, i, colAbs, letters, rowAbs, digits) : i;
        std::optional<std::uint32_t> col;
        if (end != i) col = parse_column(letters);
        if (!col || digits.size() > 7) {
            // Copy the whole name or number so a reference is never matched mid-token.
            std::size_t j = i + 1;
            if (is_name_char(c)) while (j < formula.size() && is_name_char(formula[j])) ++j;
            out.append(formula, i, j - i);
            i = j;
            continue;
        }

        const std::int64_t newCol = *col + (colAbs ? 0 : cols);
        const std::int64_t newRow = static_cast<std::int64_t>(std::stoul(digits)) - 1 + (rowAbs ? 0 : rows);
        if (newCol < 0 || newRow < 0 || newCol >= kMaxCols || newRow >= kMaxRows) {
            out += "#REF!";
        } else {
            if (colAbs) out += '$';
            out += column_letters(static_cast<std::uint32_t>(newCol));
            if (rowAbs) out += '$';
            out += std::to_string(newRow + 1);
        }
        i = end;
    }
    return out;
}

} // namespace util
