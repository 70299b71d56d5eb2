#include "custom_rules.hpp"
#include "util_text.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace payroll {

namespace {

const char *type_name(ItemType t) {
    switch (t) {
    case ItemType::Code:  return "code";
    case ItemType::Label: return "label";
    case ItemType::Row:   return "row";
    case ItemType::Cell:  return "cell";
    }
    return "label";
}

std::optional<ItemType> parse_type(std::string s) {
    for (char &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (s == "code") return ItemType::Code;
    if (s == "label") return ItemType::Label;
    if (s == "row") return ItemType::Row;
    if (s == "cell") return ItemType::Cell;
    return std::nullopt;
}

std::vector<std::string> split(const std::string &s, const std::string &sep) {
    std::vector<std::string> out;
    std::size_t start = 0;
    for (;;) {
        const auto pos = s.find(sep, start);
        out.push_back(s.substr(start, pos - start));
        if (pos == std::string::npos) break;
        start = pos + sep.size();
    }
    return out;
}

// "75" or "66-74", 1-based inclusive.
std::vector<std::uint32_t> parse_row_range(const std::string &key) {
    std::vector<std::uint32_t> rows;
    const auto dash = key.find('-');
    const std::string a = util::trim(key.substr(0, dash));
    const std::string b = dash == std::string::npos ? a : util::trim(key.substr(dash + 1));
    char *end_a = nullptr;
    char *end_b = nullptr;
    const unsigned long first = std::strtoul(a.c_str(), &end_a, 10);
    const unsigned long last = std::strtoul(b.c_str(), &end_b, 10);
    if (a.empty() || b.empty() || *end_a || *end_b || first == 0 || last < first || last > util::kMaxRows)
        return rows;
    for (unsigned long r = first; r <= last; ++r) rows.push_back(static_cast<std::uint32_t>(r - 1));
    return rows;
}

// "5@1" -> rows "5", block column 1.
bool split_cell_key(const std::string &key, std::string &rows, std::uint32_t &offset) {
    const auto at = key.find('@');
    if (at == std::string::npos) return false;
    const std::string col = util::trim(key.substr(at + 1));
    char *end = nullptr;
    const unsigned long v = std::strtoul(col.c_str(), &end, 10);
    if (col.empty() || *end || v >= util::kMaxCols) return false;
    rows = key.substr(0, at);
    offset = static_cast<std::uint32_t>(v);
    return true;
}

const std::vector<std::uint32_t> &rows_for(const RuleItem &item, const SourceIndex &index,
                                           std::vector<std::uint32_t> &scratch) {
    static const std::vector<std::uint32_t> none;
    if (item.type == ItemType::Row) {
        scratch = parse_row_range(item.key);
        return scratch;
    }
    if (item.type == ItemType::Cell) {
        std::string rows;
        std::uint32_t offset = 0;
        scratch.clear();
        if (split_cell_key(item.key, rows, offset)) scratch = parse_row_range(rows);
        return scratch;
    }
    const auto &table = item.type == ItemType::Code ? index.codeRows : index.labelRows;
    const std::string key = item.type == ItemType::Code ? util::trim(item.key) : util::normalize_label(item.key);
    auto it = table.find(key);
    return it == table.end() ? none : it->second;
}

const std::string kHeader[] = {"Sheet1_Label", "Mapping_Type", "Feuil1_Keys"};

void write_header(excel::Sheet &sheet) {
    for (std::uint32_t c = 0; c < 3; ++c) sheet.set({0, c}, excel::Cell::of_text(kHeader[c]));
}

} // namespace

std::string serialize_items(const std::vector<RuleItem> &items) {
    std::string out;
    for (const auto &item : items) {
        if (!out.empty()) out += ";;";
        out += fmt::format("{}::{}::{}", item.op, item.key, type_name(item.type));
    }
    return out;
}

std::vector<RuleItem> parse_items(const std::string &text) {
    std::vector<RuleItem> items;
    if (util::trim(text).empty()) return items;
    for (const auto &entry : split(text, ";;")) {
        const auto parts = split(entry, "::");
        if (parts.size() != 3) continue;
        const std::string op = util::trim(parts[0]);
        const std::string key = util::trim(parts[1]);
        const auto type = parse_type(util::trim(parts[2]));
        if (op.size() != 1 || std::string("+-*/").find(op[0]) == std::string::npos) continue;
        if (key.empty() || !type) continue;
        items.push_back({key, op[0], *type});
    }
    return items;
}

std::optional<CustomRule> parse_rule_spec(const std::string &spec) {
    const auto eq = spec.find('=');
    if (eq == std::string::npos) return std::nullopt;
    CustomRule rule{util::trim(spec.substr(0, eq)), parse_items(spec.substr(eq + 1))};
    if (rule.targetLabel.empty() || rule.items.empty()) return std::nullopt;
    return rule;
}

std::vector<CustomRule> load_rules(const excel::Workbook &book) {
    std::vector<CustomRule> rules;
    const excel::Sheet *sheet = book.find(kCustomSheet);
    if (!sheet) return rules;

    for (std::uint32_t r = 1; r < sheet->used_rows(); ++r) {
        const std::string label = util::trim(sheet->text_at({r, 0}));
        if (label.empty()) continue;
        auto items = parse_items(sheet->text_at({r, 2}));
        if (items.empty()) continue;
        rules.push_back({label, std::move(items)});
    }
    return rules;
}

void save_rule(excel::Workbook &book, const CustomRule &rule) {
    excel::Sheet &sheet = book.add(kCustomSheet);
    if (sheet.text_at({0, 0}).empty()) write_header(sheet);

    const std::string target = util::normalize_label(rule.targetLabel);
    std::uint32_t row = std::max<std::uint32_t>(sheet.used_rows(), 1);
    for (std::uint32_t r = 1; r < sheet.used_rows(); ++r) {
        if (util::normalize_label(sheet.text_at({r, 0})) == target) {
            row = r;
            break;
        }
    }

    sheet.set({row, 0}, excel::Cell::of_text(rule.targetLabel));
    sheet.set({row, 1}, excel::Cell::of_text("mixed"));
    sheet.set({row, 2}, excel::Cell::of_text(serialize_items(rule.items)));
}

void reset_rules(excel::Workbook &book) {
    excel::Sheet *sheet = book.find(kCustomSheet);
    if (!sheet) return;
    *sheet = excel::Sheet(sheet->name());
    write_header(*sheet);
}

std::vector<CustomRule> builtin_table_rules() {
    return {
        {"Cotisations salarié", {{"5@1", '+', ItemType::Cell}}},
        {"Cotisations patronales", {{"5@2", '+', ItemType::Cell}}},
        {"PAS", {{"75", '+', ItemType::Row}}},
        {"Avantages", {{"66-74", '+', ItemType::Row}}},
    };
}

SourceIndex index_source(const excel::Sheet &src, const BlockLayout &layout) {
    SourceIndex index;
    const std::uint32_t rows = src.used_rows();
    for (std::uint32_t r = 0; r < rows; ++r) {
        const std::string code = util::trim(src.text_at({r, layout.codeCol}));
        const std::string label = util::normalize_label(src.text_at({r, layout.fieldCol}));
        if (!code.empty()) index.codeRows[code].push_back(r);
        if (!label.empty()) index.labelRows[label].push_back(r);
    }
    return index;
}

std::optional<double> evaluate_rule(const CustomRule &rule, const SourceIndex &index,
                                    const excel::Sheet &src, std::uint32_t blockCol,
                                    std::uint32_t blockWidth) {
    std::optional<double> total;
    std::vector<std::uint32_t> scratch;
    for (const auto &item : rule.items) {
        const auto &rows = rows_for(item, index, scratch);
        if (rows.empty()) continue;

        std::uint32_t first = blockCol;
        std::uint32_t last = blockCol + blockWidth;
        if (item.type == ItemType::Cell) {
            std::string unused;
            std::uint32_t offset = 0;
            split_cell_key(item.key, unused, offset);
            first = blockCol + offset;
            last = first + 1;
        }

        double part = 0.0;
        for (std::uint32_t r : rows)
            for (std::uint32_t c = first; c < last; ++c)
                if (auto v = src.number_at({r, c})) part += *v;

        if (!total) total = (item.op == '+' || item.op == '-') ? 0.0 : 1.0;
        switch (item.op) {
        case '+': *total += part; break;
        case '-': *total -= part; break;
        case '*': *total *= part; break;
        case '/': if (part != 0.0) *total /= part; break;
        }
    }
    return total;
}

FillPlan plan_rule_fill(const CustomRule &rule, const excel::Sheet &src, const BlockLayout &layout,
                        const TargetIndex &target) {
    FillPlan plan;
    const std::string label = util::normalize_label(rule.targetLabel);
    auto col = target.columns.find(label);
    if (col == target.columns.end() || col->second == target.idCol) {
        plan.warnings.push_back({WarningKind::MissingColumn, rule.targetLabel, 0, {}});
        return plan;
    }

    const SourceIndex index = index_source(src, layout);
    for (const auto &block : employee_blocks(src, layout, target.idWidth)) {
        auto row = target.rows.find(block.first);
        if (row == target.rows.end()) continue;
        if (auto value = evaluate_rule(rule, index, src, block.second, layout.blockWidth))
            plan.writes.push_back({{row->second, col->second}, *value, rule.targetLabel, 0});
    }
    return plan;
}

} // namespace payroll
