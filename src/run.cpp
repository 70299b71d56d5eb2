#include "run.hpp"
#include "errors.hpp"
#include "excel_writer.hpp"
#include "util_text.hpp"
#include "xlsx_reader.hpp"

#include <fmt/format.h>

#include <map>
#include <set>
#include <utility>

namespace payroll {

namespace {

excel::Sheet &require_sheet(excel::Workbook &book, const std::string &name, const char *role) {
    excel::Sheet *sheet = book.find(name);
    if (!sheet) throw excel::WorkbookError(fmt::format("{} sheet '{}' not found", role, name));
    return *sheet;
}

// Later plans replace earlier ones cell by cell, so every destination is
// written exactly once when the stage is applied.
class WriteStage {
public:
    void add(FillPlan plan, const Highlight &hl) {
        for (auto &w : plan.writes) cells_[w.cell] = {std::move(w), hl};
        for (auto &w : plan.warnings) warnings_.push_back(std::move(w));
    }

    FillOutcome apply(excel::Sheet &target) {
        FillOutcome out;
        out.warnings = std::move(warnings_);
        for (auto &kv : cells_) {
            FillPlan single;
            single.writes.push_back(kv.second.first);
            for (const auto &ref : apply_plan(single, target, kv.second.second)) out.written.insert(ref);
        }
        return out;
    }

private:
    std::map<util::CellRef, std::pair<CellWrite, Highlight>> cells_;
    std::vector<Warning> warnings_;
};

} // namespace

FieldMapping mapping_for(const RunConfig &cfg) {
    FieldMapping mapping;
    if (!cfg.mappingPath.empty()) mapping = load_field_mapping(cfg.mappingPath);
    if (cfg.defaultAliases || mapping.aliases.empty()) {
        // Entries from the file take precedence over the built-in table.
        for (const auto &kv : default_aliases()) mapping.aliases.emplace(kv.first, kv.second);
    }
    return mapping;
}

FillOutcome fill_workbook(excel::Workbook &book, const FieldMapping &mapping, const RunConfig &cfg) {
    const bool has_rules = !mapping.rules.empty() || !cfg.rules.empty() || !cfg.rulesToSave.empty();
    if (cfg.mode == FillMode::Cells && mapping.fields.empty())
        throw ConfigError("field mapping has no field entries");
    if (cfg.mode == FillMode::Cells && has_rules)
        throw ConfigError("custom rules need the employee table mode");

    // CustomMap edits may add a sheet; do them before holding sheet references.
    std::vector<CustomRule> rules;
    if (cfg.mode == FillMode::Table) {
        if (cfg.reset) reset_rules(book);
        rules = mapping.rules;
        for (const auto &r : load_rules(book)) rules.push_back(r);
        for (const auto &r : cfg.rules) rules.push_back(r);
        for (const auto &r : cfg.rulesToSave) {
            rules.push_back(r);
            save_rule(book, r);
        }
    }

    const excel::Sheet &src = require_sheet(book, cfg.sourceSheet, "source");
    excel::Sheet &target = require_sheet(book, cfg.targetSheet, "target");

    WriteStage stage;
    if (cfg.mode == FillMode::Cells) {
        if (cfg.reset) {
            for (const auto &kv : mapping.fields) target.erase(kv.second);
        }
        stage.add(plan_fill(read_source_records(src, cfg.source), mapping, cfg.duplicates), kFillHighlight);
    } else {
        if (cfg.reset) clear_table(target, cfg.table);
        const TargetIndex index = index_target(target, cfg.table);
        const EmployeeRecords records = extract_employee_records(src, cfg.blocks, mapping.aliases, index.idWidth);
        std::set<std::string> filter;
        for (const auto &f : cfg.fields) filter.insert(mapping.canonical(f));
        stage.add(plan_table_fill(records, index, filter), kFillHighlight);

        // Built-in fields only where the target has a column for them.
        if (cfg.builtinRules) {
            for (const auto &rule : builtin_table_rules()) {
                const std::string label = util::normalize_label(rule.targetLabel);
                if (!index.columns.count(label) || (!filter.empty() && !filter.count(label))) continue;
                stage.add(plan_rule_fill(rule, src, cfg.blocks, index), kFillHighlight);
            }
        }
        for (const auto &rule : rules) stage.add(plan_rule_fill(rule, src, cfg.blocks, index), kRuleHighlight);
    }
    return stage.apply(target);
}

RunReport run_fill(const RunConfig &cfg) {
    RunReport report;
    report.outputPath = cfg.outputPath.empty() ? cfg.workbookPath : cfg.outputPath;
    try {
        const FieldMapping mapping = mapping_for(cfg);
        excel::Workbook book = excel::load_workbook(cfg.workbookPath);
        FillOutcome outcome = fill_workbook(book, mapping, cfg);
        if (!cfg.dryRun) excel::save_workbook(book, report.outputPath);

        report.warnings = std::move(outcome.warnings);
        report.written = std::move(outcome.written);
        report.ok = true;
    } catch (const excel::WorkbookError &e) {
        report.error = e.what();
    } catch (const ConfigError &e) {
        report.error = e.what();
    } catch (const FillError &e) {
        report.error = e.what();
    } catch (const std::exception &e) {
        report.error = fmt::format("unexpected failure: {}", e.what());
    }
    return report;
}

} // namespace payroll
