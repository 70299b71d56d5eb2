#pragma once
#include "cell_ref.hpp"
#include "models.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace payroll {

enum class WarningKind {
    UnmappedLabel,
    BlankValue,
    NonNumericValue,
    DuplicateLabel,
    UnknownEmployee,
    MissingColumn,
};

// A skipped row or field. `row` is 1-based as shown in the spreadsheet, 0 if
// the warning is not tied to a row.
struct Warning {
    WarningKind kind;
    std::string label;
    std::uint32_t row = 0;
    std::string detail;
};

std::string describe(const Warning &w);

struct CellWrite {
    util::CellRef cell;
    double value = 0.0;
    std::string label;
    std::uint32_t sourceRow = 0;
};

struct FillPlan {
    std::vector<CellWrite> writes; // at most one per destination cell
    std::vector<Warning> warnings;
};

struct Highlight {
    bool bold = true;
    std::uint32_t fill = 0xFFFF99;
};

constexpr Highlight kFillHighlight{true, 0xFFFF99};
constexpr Highlight kRuleHighlight{true, 0xCCFFCC};

// Stores each planned value in `target` and marks the cell. Number formats of
// the destination are kept. Returns the cells written.
std::set<util::CellRef> apply_plan(const FillPlan &plan, excel::Sheet &target, const Highlight &hl);

} // namespace payroll
