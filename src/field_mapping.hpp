#pragma once
#include "cell_ref.hpp"
#include "custom_rules.hpp"

#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace payroll {

// Static label -> destination table. Keys are normalized labels.
struct FieldMapping {
    std::map<std::string, util::CellRef> fields;
    std::map<std::string, std::string> aliases; // normalized raw label -> normalized canonical label
    std::vector<CustomRule> rules;

    void add_field(const std::string &label, const util::CellRef &cell);
    void add_alias(const std::string &raw, const std::string &canonical);

    // Normalized label after alias substitution.
    std::string canonical(const std::string &label) const;
    std::optional<util::CellRef> resolve(const std::string &label) const;
};

// Tab-separated lines:
//   field <label> <A1 cell>
//   alias <raw label> <canonical label>
//   rule  <target label> <serialized items>
// Blank lines and '#' comments are ignored. Throws ConfigError.
FieldMapping parse_field_mapping(std::istream &in, const std::string &origin);
FieldMapping load_field_mapping(const std::string &path);

// Harmonization table for French payroll exports.
const std::map<std::string, std::string> &default_aliases();

} // namespace payroll
