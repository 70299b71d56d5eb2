#pragma once
#include "employee_table.hpp"
#include "fill_plan.hpp"
#include "models.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace payroll {

// code: column A of the source; label: normalized label in column B;
// row: "75" or "66-74" (1-based); cell: rows plus a block column, "5@1".
enum class ItemType { Code, Label, Row, Cell };

// One operand of a rule: the rows matching `key` summed across an employee
// block, or down a single column of it for cell items.
struct RuleItem {
    std::string key;
    char op = '+';
    ItemType type = ItemType::Label;
};

inline bool operator==(const RuleItem &a, const RuleItem &b) {
    return a.key == b.key && a.op == b.op && a.type == b.type;
}

struct CustomRule {
    std::string targetLabel;
    std::vector<RuleItem> items;
};

constexpr const char *kCustomSheet = "CustomMap";

// "+::F07::code;;-::Salaire de base::label;;+::66-74::row"
std::string serialize_items(const std::vector<RuleItem> &items);
std::vector<RuleItem> parse_items(const std::string &text);

// "<target label>=<serialized items>"; empty when either side is missing.
std::optional<CustomRule> parse_rule_spec(const std::string &spec);

std::vector<CustomRule> load_rules(const excel::Workbook &book);
void save_rule(excel::Workbook &book, const CustomRule &rule);
void reset_rules(excel::Workbook &book);

// Special fields of the Feuil1 export: employee and employer contributions
// on row 5 (block columns 2 and 3), PAS on row 75, benefits on rows 66-74.
std::vector<CustomRule> builtin_table_rules();

// Row lookup tables over the code and label columns of the source sheet.
struct SourceIndex {
    std::map<std::string, std::vector<std::uint32_t>> codeRows;
    std::map<std::string, std::vector<std::uint32_t>> labelRows; // keyed by normalized label
};

SourceIndex index_source(const excel::Sheet &src, const BlockLayout &layout);

std::optional<double> evaluate_rule(const CustomRule &rule, const SourceIndex &index,
                                    const excel::Sheet &src, std::uint32_t blockCol,
                                    std::uint32_t blockWidth);

FillPlan plan_rule_fill(const CustomRule &rule, const excel::Sheet &src, const BlockLayout &layout,
                        const TargetIndex &target);

} // namespace payroll
