#include "fill_plan.hpp"
#include "util_text.hpp"

#include <fmt/format.h>

namespace payroll {

std::string describe(const Warning &w) {
    std::string where = w.row ? fmt::format("row {}: ", w.row) : std::string{};
    switch (w.kind) {
    case WarningKind::UnmappedLabel:
        return fmt::format("{}no mapping for label \"{}\"", where, w.label);
    case WarningKind::BlankValue:
        return fmt::format("{}\"{}\" has no value", where, w.label);
    case WarningKind::NonNumericValue:
        return fmt::format("{}\"{}\" value \"{}\" is not a number", where, w.label, w.detail);
    case WarningKind::DuplicateLabel:
        return fmt::format("{}\"{}\" {}", where, w.label, w.detail);
    case WarningKind::UnknownEmployee:
        return fmt::format("employee {} is not listed on the target sheet", w.label);
    case WarningKind::MissingColumn:
        return fmt::format("no target column for \"{}\"", w.label);
    }
    return w.label;
}

std::set<util::CellRef> apply_plan(const FillPlan &plan, excel::Sheet &target, const Highlight &hl) {
    std::set<util::CellRef> written;
    for (const auto &w : plan.writes) {
        excel::Cell &cell = target.at(w.cell);
        excel::CellStyle style = cell.style;
        style.bold = hl.bold;
        style.fill = hl.fill;

        cell = excel::Cell::of_number(w.value);
        cell.style = std::move(style);
        written.insert(w.cell);
    }
    return written;
}

} // namespace payroll
