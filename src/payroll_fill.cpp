#include "payroll_fill.hpp"
#include "errors.hpp"
#include "util_text.hpp"

#include <fmt/format.h>

#include <map>

namespace payroll {

std::optional<DuplicatePolicy> parse_duplicate_policy(const std::string &name) {
    if (name == "last") return DuplicatePolicy::LastWins;
    if (name == "first") return DuplicatePolicy::FirstWins;
    if (name == "error") return DuplicatePolicy::Error;
    return std::nullopt;
}

const char *to_string(DuplicatePolicy p) {
    switch (p) {
    case DuplicatePolicy::LastWins:  return "last";
    case DuplicatePolicy::FirstWins: return "first";
    case DuplicatePolicy::Error:     return "error";
    }
    return "last";
}

std::vector<SourceRecord> read_source_records(const excel::Sheet &src, const SourceLayout &layout) {
    std::vector<SourceRecord> records;
    if (src.used_rows() == 0) return records;
    const std::uint32_t last = layout.lastRow ? *layout.lastRow : src.used_rows() - 1;

    for (std::uint32_t r = layout.firstRow; r <= last; ++r) {
        std::string label = util::trim(src.text_at({r, layout.labelCol}));
        if (label.empty()) continue;

        SourceRecord rec;
        rec.row = r + 1;
        rec.label = std::move(label);
        const excel::Cell *cell = src.get({r, layout.valueCol});
        if (cell && cell->kind == excel::CellKind::Number) {
            rec.value = cell->number;
        } else if (cell && cell->kind != excel::CellKind::Blank) {
            const std::string text = util::trim(src.text_at({r, layout.valueCol}));
            if (auto v = util::parse_number(text)) rec.value = v;
            else if (!text.empty()) rec.rawValue = text;
        }
        records.push_back(std::move(rec));
    }
    return records;
}

FillPlan plan_fill(const std::vector<SourceRecord> &records, const FieldMapping &mapping,
                   DuplicatePolicy policy) {
    FillPlan plan;
    std::map<util::CellRef, CellWrite> staged;

    for (const auto &rec : records) {
        auto dest = mapping.resolve(rec.label);
        if (!dest) {
            plan.warnings.push_back({WarningKind::UnmappedLabel, rec.label, rec.row, {}});
            continue;
        }
        if (!rec.rawValue.empty()) {
            plan.warnings.push_back({WarningKind::NonNumericValue, rec.label, rec.row, rec.rawValue});
            continue;
        }
        if (!rec.value) {
            plan.warnings.push_back({WarningKind::BlankValue, rec.label, rec.row, {}});
            continue;
        }

        auto it = staged.find(*dest);
        if (it == staged.end()) {
            staged.emplace(*dest, CellWrite{*dest, *rec.value, rec.label, rec.row});
            continue;
        }

        const std::uint32_t earlier = it->second.sourceRow;
        switch (policy) {
        case DuplicatePolicy::LastWins:
            plan.warnings.push_back({WarningKind::DuplicateLabel, rec.label, rec.row,
                fmt::format("overrides row {} in {}", earlier, util::to_a1(*dest))});
            it->second = CellWrite{*dest, *rec.value, rec.label, rec.row};
            break;
        case DuplicatePolicy::FirstWins:
            plan.warnings.push_back({WarningKind::DuplicateLabel, rec.label, rec.row,
                fmt::format("ignored, {} already filled from row {}", util::to_a1(*dest), earlier)});
            break;
        case DuplicatePolicy::Error:
            throw FillError(fmt::format("rows {} and {} both map to {} (\"{}\")", earlier, rec.row,
                util::to_a1(*dest), rec.label));
        }
    }

    for (auto &kv : staged) plan.writes.push_back(std::move(kv.second));
    return plan;
}

} // namespace payroll
