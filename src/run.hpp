#pragma once
#include "custom_rules.hpp"
#include "employee_table.hpp"
#include "field_mapping.hpp"
#include "fill_plan.hpp"
#include "payroll_fill.hpp"

#include <set>
#include <string>
#include <vector>

namespace payroll {

enum class FillMode {
    Cells, // label/value rows -> fixed template cells
    Table, // employee blocks -> employee x field table
};

struct RunConfig {
    std::string workbookPath;
    std::string outputPath; // empty: save in place
    FillMode mode = FillMode::Cells;
    std::string sourceSheet = "Feuil1";
    std::string targetSheet = "Sheet1";
    std::string mappingPath;
    bool defaultAliases = false;
    SourceLayout source;
    BlockLayout blocks;
    TargetLayout table;
    DuplicatePolicy duplicates = DuplicatePolicy::LastWins;
    std::vector<CustomRule> rules;       // applied to this run only
    std::vector<CustomRule> rulesToSave; // applied and stored in the workbook
    bool builtinRules = true;            // contributions, PAS and benefits in table mode
    std::vector<std::string> fields;     // table mode: only these fields; empty for all
    bool reset = false;
    bool dryRun = false;
};

struct RunReport {
    bool ok = false;
    std::string error;
    std::vector<Warning> warnings;
    std::set<util::CellRef> written;
    std::string outputPath;
};

struct FillOutcome {
    std::vector<Warning> warnings;
    std::set<util::CellRef> written;
};

// In-memory part of a run. Throws WorkbookError, ConfigError or FillError.
FillOutcome fill_workbook(excel::Workbook &book, const FieldMapping &mapping, const RunConfig &cfg);

// Mapping used by a run: the mapping file (if any) plus default aliases when
// requested or when the file defines none. Throws ConfigError.
FieldMapping mapping_for(const RunConfig &cfg);

// Single entry point: load, fill, commit. Never throws for run failures; they
// are reported through RunReport::error.
RunReport run_fill(const RunConfig &cfg);

} // namespace payroll
