#include "models.hpp"
#include "util_text.hpp"

#include <algorithm>
#include <utility>

namespace excel {

Cell Cell::of_number(double v) {
    Cell c;
    c.kind = CellKind::Number;
    c.number = v;
    return c;
}

Cell Cell::of_text(std::string s) {
    Cell c;
    c.kind = CellKind::Text;
    c.text = std::move(s);
    return c;
}

Cell Cell::of_bool(bool b) {
    Cell c;
    c.kind = CellKind::Boolean;
    c.number = b ? 1.0 : 0.0;
    return c;
}

bool operator==(const Cell &a, const Cell &b) {
    return a.kind == b.kind && a.number == b.number && a.text == b.text &&
           a.formula == b.formula && a.arrayRange == b.arrayRange && a.style == b.style;
}

Sheet::Sheet(std::string name) : name_(std::move(name)) {}

const Cell *Sheet::get(const util::CellRef &ref) const {
    auto it = cells_.find(ref);
    return it == cells_.end() ? nullptr : &it->second;
}

Cell &Sheet::at(const util::CellRef &ref) { return cells_[ref]; }

void Sheet::set(const util::CellRef &ref, Cell cell) { cells_[ref] = std::move(cell); }

void Sheet::erase(const util::CellRef &ref) { cells_.erase(ref); }

std::optional<double> Sheet::number_at(const util::CellRef &ref) const {
    const Cell *c = get(ref);
    if (!c || c->kind != CellKind::Number) return std::nullopt;
    return c->number;
}

std::string Sheet::text_at(const util::CellRef &ref) const {
    const Cell *c = get(ref);
    if (!c) return "";
    switch (c->kind) {
    case CellKind::Number:  return util::format_number(c->number);
    case CellKind::Text:    return c->text;
    case CellKind::Boolean: return c->number != 0.0 ? "TRUE" : "FALSE";
    case CellKind::Blank:   break;
    }
    return "";
}

std::uint32_t Sheet::used_rows() const {
    return cells_.empty() ? 0 : cells_.rbegin()->first.row + 1;
}

std::uint32_t Sheet::used_cols() const {
    std::uint32_t n = 0;
    for (const auto &kv : cells_) n = std::max(n, kv.first.col + 1);
    return n;
}

Sheet *Workbook::find(const std::string &name) {
    for (auto &s : sheets)
        if (util::iequals(s.name(), name)) return &s;
    return nullptr;
}

const Sheet *Workbook::find(const std::string &name) const {
    for (const auto &s : sheets)
        if (util::iequals(s.name(), name)) return &s;
    return nullptr;
}

Sheet &Workbook::add(const std::string &name) {
    if (Sheet *existing = find(name)) return *existing;
    sheets.emplace_back(name);
    return sheets.back();
}

} // namespace excel
