#include "field_mapping.hpp"
#include "errors.hpp"
#include "util_text.hpp"

#include <fmt/format.h>

#include <fstream>
#include <string>

namespace payroll {

namespace {

std::vector<std::string> split_tsv(const std::string &line) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : line) {
        if (c == '\t') { out.push_back(cur); cur.clear(); }
        else if (c != '\r' && c != '\n') cur.push_back(c);
    }
    out.push_back(cur);
    return out;
}

} // namespace

void FieldMapping::add_field(const std::string &label, const util::CellRef &cell) {
    fields[util::normalize_label(label)] = cell;
}

void FieldMapping::add_alias(const std::string &raw, const std::string &canonical) {
    aliases[util::normalize_label(raw)] = util::normalize_label(canonical);
}

std::string FieldMapping::canonical(const std::string &label) const {
    std::string norm = util::normalize_label(label);
    auto it = aliases.find(norm);
    return it == aliases.end() ? norm : it->second;
}

std::optional<util::CellRef> FieldMapping::resolve(const std::string &label) const {
    auto it = fields.find(canonical(label));
    if (it == fields.end()) return std::nullopt;
    return it->second;
}

FieldMapping parse_field_mapping(std::istream &in, const std::string &origin) {
    FieldMapping mapping;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const std::string trimmed = util::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') continue;

        auto cols = split_tsv(line);
        for (auto &c : cols) c = util::trim(c);
        if (cols.size() != 3 || cols[1].empty() || cols[2].empty()) {
            throw ConfigError(fmt::format("{}:{}: expected <kind>\\t<label>\\t<value>", origin, lineno));
        }

        if (cols[0] == "field") {
            auto cell = util::parse_cell_ref(cols[2]);
            if (!cell) throw ConfigError(fmt::format("{}:{}: invalid cell address '{}'", origin, lineno, cols[2]));
            if (util::normalize_label(cols[1]).empty())
                throw ConfigError(fmt::format("{}:{}: label '{}' is empty once normalized", origin, lineno, cols[1]));
            mapping.add_field(cols[1], *cell);
        } else if (cols[0] == "alias") {
            mapping.add_alias(cols[1], cols[2]);
        } else if (cols[0] == "rule") {
            auto items = parse_items(cols[2]);
            if (items.empty()) throw ConfigError(fmt::format("{}:{}: rule '{}' has no valid items", origin, lineno, cols[1]));
            mapping.rules.push_back({cols[1], std::move(items)});
        } else {
            throw ConfigError(fmt::format("{}:{}: unknown entry kind '{}'", origin, lineno, cols[0]));
        }
    }
    return mapping;
}

FieldMapping load_field_mapping(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw ConfigError(fmt::format("cannot open field mapping '{}'", path));
    return parse_field_mapping(in, path);
}

const std::map<std::string, std::string> &default_aliases() {
    static const std::map<std::string, std::string> table = {
        // Salary
        {"salaire brut total", "salaire brut"},
        {"salaire brut", "salaire brut"},
        {"salaire de base mensuel", "salaire de base"},
        {"salaire de base", "salaire de base"},
        // Employee contributions
        {"cot salarie", "cotisations salarie"},
        {"cotisations salarie", "cotisations salarie"},
        {"salarial", "cotisations salarie"},
        {"total salarial", "cotisations salarie"},
        // Employer contributions
        {"cot patronale", "cotisations patronales"},
        {"cotisations patronales", "cotisations patronales"},
        {"patronal", "cotisations patronales"},
        {"total patronal", "cotisations patronales"},
        // Net pay and withholding tax (PAS)
        {"net a payer", "net paye"},
        {"net paye", "net paye"},
        {"net imposable", "net imposable"},
        {"pas", "pas"},
        {"prelevement a la source", "pas"},
        {"impot", "pas"},
        // Benefits
        {"avantage", "avantages"},
        {"avantages", "avantages"},
        {"avantages en nature", "avantages"},
    };
    return table;
}

} // namespace payroll
