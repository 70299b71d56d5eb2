#pragma once
#include "cell_ref.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace excel {

class WorkbookError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Visual attributes carried through a load/save cycle.
struct CellStyle {
    bool bold = false;
    std::optional<std::uint32_t> fill; // solid fill, 0xRRGGBB
    std::uint16_t numFormatId = 0;     // built-in number format
    std::string numFormat;             // custom number format code

    bool is_default() const { return !bold && !fill && numFormatId == 0 && numFormat.empty(); }
};

inline bool operator<(const CellStyle &a, const CellStyle &b) {
    return std::tie(a.bold, a.fill, a.numFormatId, a.numFormat) <
           std::tie(b.bold, b.fill, b.numFormatId, b.numFormat);
}
inline bool operator==(const CellStyle &a, const CellStyle &b) {
    return a.bold == b.bold && a.fill == b.fill && a.numFormatId == b.numFormatId &&
           a.numFormat == b.numFormat;
}

enum class CellKind { Blank, Number, Text, Boolean };

struct Cell {
    CellKind kind = CellKind::Blank;
    double number = 0.0;
    std::string text;
    std::string formula; // without leading '='; value fields hold the cached result
    std::string arrayRange; // set on the anchor of an array formula, e.g. "C1:C3"
    CellStyle style;

    static Cell of_number(double v);
    static Cell of_text(std::string s);
    static Cell of_bool(bool b);
};

bool operator==(const Cell &a, const Cell &b);

class Sheet {
public:
    explicit Sheet(std::string name);

    const std::string &name() const { return name_; }

    // VBA code name (<sheetPr codeName>), which sheet modules are bound to.
    const std::string &code_name() const { return codeName_; }
    void set_code_name(std::string name) { codeName_ = std::move(name); }
    const Cell *get(const util::CellRef &ref) const;
    Cell &at(const util::CellRef &ref);
    void set(const util::CellRef &ref, Cell cell);
    void erase(const util::CellRef &ref);

    std::optional<double> number_at(const util::CellRef &ref) const;
    std::string text_at(const util::CellRef &ref) const;

    // One past the last populated row/column, 0 when empty.
    std::uint32_t used_rows() const;
    std::uint32_t used_cols() const;

    const std::map<util::CellRef, Cell> &cells() const { return cells_; }

private:
    std::string name_;
    std::string codeName_;
    std::map<util::CellRef, Cell> cells_;
};

struct Workbook {
    std::vector<Sheet> sheets;
    std::string vbaProject; // raw xl/vbaProject.bin of macro-enabled workbooks
    std::string codeName;   // <workbookPr codeName>, usually ThisWorkbook

    Sheet *find(const std::string &name);
    const Sheet *find(const std::string &name) const;
    Sheet &add(const std::string &name);
};

} // namespace excel
