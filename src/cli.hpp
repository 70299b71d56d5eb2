#pragma once
#include "cell_ref.hpp"
#include "custom_rules.hpp"
#include "payroll_fill.hpp"
#include "run.hpp"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

struct Options {
    payroll::RunConfig run;
    bool quiet = false;
    bool help = false;
    std::string error; // non-empty on a usage error
};

namespace cli_detail {

inline std::optional<std::uint32_t> parse_row(const std::string &s) {
    char *end = nullptr;
    const unsigned long v = std::strtoul(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || v == 0 || v > util::kMaxRows) return std::nullopt;
    return static_cast<std::uint32_t>(v - 1);
}

inline std::optional<std::uint32_t> parse_count(const std::string &s) {
    char *end = nullptr;
    const unsigned long v = std::strtoul(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || v == 0 || v > util::kMaxCols) return std::nullopt;
    return static_cast<std::uint32_t>(v);
}

} // namespace cli_detail

inline Options parse_cli(int argc, char **argv) {
    Options opt;
    payroll::RunConfig &cfg = opt.run;

    auto fail = [&](const std::string &msg) {
        if (opt.error.empty()) opt.error = msg;
    };

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 < argc) return argv[++i];
            fail(a + " needs a value");
            return "";
        };
        auto column = [&](std::uint32_t &out) {
            const std::string v = value();
            if (auto c = util::parse_column(v)) out = *c;
            else fail("invalid column '" + v + "' for " + a);
        };
        auto row = [&](std::uint32_t &out) {
            const std::string v = value();
            if (auto r = cli_detail::parse_row(v)) out = *r;
            else fail("invalid row '" + v + "' for " + a);
        };
        auto rule = [&](std::vector<payroll::CustomRule> &out) {
            const std::string v = value();
            if (auto r = payroll::parse_rule_spec(v)) out.push_back(*r);
            else fail("invalid rule '" + v + "', expected \"Label=+::KEY::code|label|row|cell;;...\"");
        };

        if (a == "-h" || a == "--help") {
            opt.help = true;
        } else if (a == "-o" || a == "--output") {
            cfg.outputPath = value();
        } else if (a == "--mapping") {
            cfg.mappingPath = value();
        } else if (a == "--mode") {
            const std::string v = value();
            if (v == "cells") cfg.mode = payroll::FillMode::Cells;
            else if (v == "table") cfg.mode = payroll::FillMode::Table;
            else fail("unknown mode '" + v + "'");
        } else if (a == "--source") {
            cfg.sourceSheet = value();
        } else if (a == "--target") {
            cfg.targetSheet = value();
        } else if (a == "--label-col") {
            column(cfg.source.labelCol);
        } else if (a == "--value-col") {
            column(cfg.source.valueCol);
        } else if (a == "--first-row") {
            row(cfg.source.firstRow);
        } else if (a == "--last-row") {
            std::uint32_t r = 0;
            row(r);
            cfg.source.lastRow = r;
        } else if (a == "--id-row") {
            row(cfg.blocks.idRow);
        } else if (a == "--field-col") {
            column(cfg.blocks.fieldCol);
        } else if (a == "--field-row") {
            row(cfg.blocks.fieldFirstRow);
        } else if (a == "--block-width") {
            const std::string v = value();
            if (auto n = cli_detail::parse_count(v)) cfg.blocks.blockWidth = *n;
            else fail("invalid block width '" + v + "'");
        } else if (a == "--duplicates") {
            const std::string v = value();
            if (auto p = payroll::parse_duplicate_policy(v)) cfg.duplicates = *p;
            else fail("unknown duplicate policy '" + v + "' (last, first, error)");
        } else if (a == "--rule") {
            rule(cfg.rules);
        } else if (a == "--save-rule") {
            rule(cfg.rulesToSave);
        } else if (a == "--reset") {
            cfg.reset = true;
        } else if (a == "--dry-run") {
            cfg.dryRun = true;
        } else if (a == "--quiet") {
            opt.quiet = true;
        } else if (a == "--field") {
            cfg.fields.push_back(value());
        } else if (a == "--no-builtin-rules") {
            cfg.builtinRules = false;
        } else if (a == "--default-aliases") {
            cfg.defaultAliases = true;
        } else if (!a.empty() && a[0] != '-') {
            if (cfg.workbookPath.empty()) cfg.workbookPath = a;
            else fail("more than one workbook given: " + a);
        } else {
            fail("unknown option " + a);
        }
    }
    if (!opt.help && opt.error.empty() && cfg.workbookPath.empty()) fail("no workbook given");
    return opt;
}
