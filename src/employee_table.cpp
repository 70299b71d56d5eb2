#include "employee_table.hpp"
#include "util_text.hpp"

#include <vector>

namespace payroll {

namespace {

std::string canonical(const std::string &label, const std::map<std::string, std::string> &aliases) {
    std::string norm = util::normalize_label(label);
    auto it = aliases.find(norm);
    return it == aliases.end() ? norm : it->second;
}

} // namespace

TargetIndex index_target(const excel::Sheet &target, const TargetLayout &layout) {
    TargetIndex index;
    index.idCol = layout.idCol;

    // Header row and id column both stop at the first blank cell.
    for (std::uint32_t c = layout.idCol;; ++c) {
        const std::string h = util::trim(target.text_at({layout.headerRow, c}));
        if (h.empty()) break;
        index.columns.emplace(util::normalize_label(h), c);
    }

    std::vector<std::pair<std::string, std::uint32_t>> ids;
    for (std::uint32_t r = layout.firstDataRow;; ++r) {
        const std::string id = util::trim(target.text_at({r, layout.idCol}));
        if (id.empty()) break;
        ids.emplace_back(id, r);
    }

    std::vector<std::string> raw;
    for (const auto &p : ids) raw.push_back(p.first);
    index.idWidth = util::employee_id_width(raw);

    for (const auto &p : ids) {
        std::string norm = util::normalize_employee_id(p.first, index.idWidth);
        if (!norm.empty()) index.rows.emplace(std::move(norm), p.second);
    }
    return index;
}

std::map<std::string, std::uint32_t> employee_blocks(const excel::Sheet &src, const BlockLayout &layout,
                                                     std::size_t idWidth) {
    std::map<std::string, std::uint32_t> blocks;
    for (std::uint32_t c = 0; c < layout.maxCols; ++c) {
        const std::string raw = util::trim(src.text_at({layout.idRow, c}));
        if (raw.empty()) continue;
        std::string id = util::normalize_employee_id(raw, idWidth);
        if (!id.empty()) blocks[id] = c;
    }
    return blocks;
}

EmployeeRecords extract_employee_records(const excel::Sheet &src, const BlockLayout &layout,
                                         const std::map<std::string, std::string> &aliases,
                                         std::size_t idWidth) {
    std::vector<std::pair<std::uint32_t, std::string>> fields;
    for (std::uint32_t r = layout.fieldFirstRow;; ++r) {
        const std::string label = util::trim(src.text_at({r, layout.fieldCol}));
        if (label.empty()) break;
        fields.emplace_back(r, canonical(label, aliases));
    }

    EmployeeRecords records;
    for (const auto &block : employee_blocks(src, layout, idWidth)) {
        EmployeeRecord &rec = records[block.first];
        for (std::uint32_t sub = 0; sub < layout.blockWidth; ++sub) {
            for (const auto &field : fields) {
                const excel::Cell *cell = src.get({field.first, block.second + sub});
                if (!cell) continue;
                if (cell->kind == excel::CellKind::Number) {
                    rec[field.second] = cell->number;
                } else if (cell->kind == excel::CellKind::Text) {
                    if (auto v = util::parse_number(cell->text)) rec[field.second] = *v;
                }
            }
        }
    }
    return records;
}

FillPlan plan_table_fill(const EmployeeRecords &records, const TargetIndex &index,
                         const std::set<std::string> &fieldFilter) {
    FillPlan plan;
    for (const auto &emp : records) {
        auto row = index.rows.find(emp.first);
        if (row == index.rows.end()) {
            plan.warnings.push_back({WarningKind::UnknownEmployee, emp.first, 0, {}});
            continue;
        }
        for (const auto &field : emp.second) {
            if (!fieldFilter.empty() && !fieldFilter.count(field.first)) continue;
            auto col = index.columns.find(field.first);
            if (col == index.columns.end() || col->second == index.idCol) continue;
            plan.writes.push_back({{row->second, col->second}, field.second, field.first, 0});
        }
    }
    return plan;
}

void clear_table(excel::Sheet &target, const TargetLayout &layout) {
    std::vector<util::CellRef> doomed;
    for (const auto &kv : target.cells()) {
        if (kv.first.row >= layout.firstDataRow && kv.first.col > layout.idCol) doomed.push_back(kv.first);
    }
    for (const auto &ref : doomed) target.erase(ref);
}

} // namespace payroll
