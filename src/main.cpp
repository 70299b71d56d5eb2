#include "cli.hpp"
#include "fill_plan.hpp"
#include "run.hpp"

#include <fmt/format.h>

static void print_usage() {
    fmt::print(stderr,
        "Usage: payfill <workbook.xlsx|.xlsm> [options]\n"
        "  --mapping FILE          field/alias/rule table (TSV)\n"
        "  --mode cells|table      label/value rows or employee blocks (default cells)\n"
        "  --source NAME           source sheet (default Feuil1)\n"
        "  --target NAME           target sheet (default Sheet1)\n"
        "  --label-col COL         cells mode: label column (default B)\n"
        "  --value-col COL         cells mode: value column (default C)\n"
        "  --first-row N           cells mode: first source row (default 1)\n"
        "  --last-row N            cells mode: last source row\n"
        "  --id-row N              table mode: employee id row (default 3)\n"
        "  --field-col COL         table mode: field label column (default B)\n"
        "  --field-row N           table mode: first field row (default 5)\n"
        "  --block-width N         table mode: columns per employee (default 3)\n"
        "  --duplicates POLICY     last, first or error (default last)\n"
        "  --field LABEL           table mode: fill only this field (repeatable)\n"
        "  --no-builtin-rules      table mode: skip contributions, PAS and benefits\n"
        "  --rule \"Label=ITEMS\"    apply a custom rule for this run\n"
        "  --save-rule \"Label=ITEMS\" apply and store a rule in the CustomMap sheet\n"
        "  --reset                 clear filled cells and stored rules first\n"
        "  --default-aliases       add the built-in label aliases\n"
        "  --dry-run               report without saving\n"
        "  --quiet                 only print the summary\n"
        "  -o, --output FILE       write to FILE instead of in place\n");
}

int main(int argc, char** argv) {
    Options opt = parse_cli(argc, argv);
    if (opt.help) {
        print_usage();
        return 0;
    }
    if (!opt.error.empty()) {
        fmt::print(stderr, "payfill: {}\n", opt.error);
        print_usage();
        return 2;
    }

    const payroll::RunReport report = payroll::run_fill(opt.run);
    if (!report.ok) {
        fmt::print(stderr, "payfill: {}\n", report.error);
        return 1;
    }

    if (!opt.quiet) {
        for (const auto& w : report.warnings) fmt::print(stderr, "warning: {}\n", payroll::describe(w));
    }
    fmt::print("Filled {} cell(s) in {} -> {}{}\n", report.written.size(), opt.run.targetSheet,
               report.outputPath, opt.run.dryRun ? " (dry run, not saved)" : "");
    return 0;
}
