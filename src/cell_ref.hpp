#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>

namespace util {

// Zero-based cell coordinates; A1 is {0, 0}.
struct CellRef {
    std::uint32_t row = 0;
    std::uint32_t col = 0;
};

inline bool operator<(const CellRef &a, const CellRef &b) {
    return std::tie(a.row, a.col) < std::tie(b.row, b.col);
}
inline bool operator==(const CellRef &a, const CellRef &b) {
    return a.row == b.row && a.col == b.col;
}
inline bool operator!=(const CellRef &a, const CellRef &b) { return !(a == b); }

constexpr std::uint32_t kMaxRows = 1048576;
constexpr std::uint32_t kMaxCols = 16384;

std::optional<CellRef> parse_cell_ref(const std::string &a1);
std::optional<std::uint32_t> parse_column(const std::string &letters);
std::string column_letters(std::uint32_t col);
std::string to_a1(const CellRef &ref);

// Moves the relative references of an A1-style formula by (rows, cols), the
// way Excel fills a shared formula into the cells below or beside its anchor.
// Text in double quotes and quoted sheet names are left alone.
std::string shift_formula(const std::string &formula, std::int64_t rows, std::int64_t cols);
}
