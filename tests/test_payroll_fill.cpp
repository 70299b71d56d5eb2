#include <gtest/gtest.h>

#include "errors.hpp"
#include "fill_plan.hpp"
#include "payroll_fill.hpp"

#include <string>
#include <vector>

namespace {

excel::Sheet source_sheet(const std::vector<std::pair<std::string, excel::Cell>> &rows) {
    excel::Sheet s("Feuil1");
    std::uint32_t r = 0;
    for (const auto &row : rows) {
        s.set({r, 1}, excel::Cell::of_text(row.first));
        if (row.second.kind != excel::CellKind::Blank) s.set({r, 2}, row.second);
        ++r;
    }
    return s;
}

payroll::FieldMapping salary_mapping() {
    payroll::FieldMapping m;
    m.add_field("salaire brut", *util::parse_cell_ref("B3"));
    m.add_field("net paye", *util::parse_cell_ref("B4"));
    m.add_alias("net a payer", "net paye");
    return m;
}

const payroll::Warning *find_warning(const payroll::FillPlan &plan, payroll::WarningKind kind) {
    for (const auto &w : plan.warnings)
        if (w.kind == kind) return &w;
    return nullptr;
}

} // namespace

TEST(ReadSourceRecords, CollectsLabelledRows) {
    excel::Sheet s("Feuil1");
    s.set({0, 1}, excel::Cell::of_text(" Salaire Brut "));
    s.set({0, 2}, excel::Cell::of_number(2500));
    s.set({1, 2}, excel::Cell::of_number(99)); // no label
    s.set({2, 1}, excel::Cell::of_text("Net à payer"));
    s.set({2, 2}, excel::Cell::of_text("1 980,00"));
    s.set({3, 1}, excel::Cell::of_text("PAS"));
    s.set({4, 1}, excel::Cell::of_text("Commentaire"));
    s.set({4, 2}, excel::Cell::of_text("voir RH"));

    const auto recs = payroll::read_source_records(s, payroll::SourceLayout{});
    ASSERT_EQ(recs.size(), 4u);
    EXPECT_EQ(recs[0].row, 1u);
    EXPECT_EQ(recs[0].label, "Salaire Brut");
    EXPECT_DOUBLE_EQ(*recs[0].value, 2500.0);
    EXPECT_EQ(recs[1].row, 3u);
    EXPECT_DOUBLE_EQ(*recs[1].value, 1980.0);
    EXPECT_FALSE(recs[2].value);
    EXPECT_TRUE(recs[2].rawValue.empty());
    EXPECT_FALSE(recs[3].value);
    EXPECT_EQ(recs[3].rawValue, "voir RH");
}

TEST(ReadSourceRecords, HonoursRowWindow) {
    excel::Sheet s = source_sheet({{"a", excel::Cell::of_number(1)},
                                   {"b", excel::Cell::of_number(2)},
                                   {"c", excel::Cell::of_number(3)}});
    payroll::SourceLayout layout;
    layout.firstRow = 1;
    layout.lastRow = 1;
    const auto recs = payroll::read_source_records(s, layout);
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_EQ(recs[0].label, "b");
}

TEST(PlanFill, MappedLabelIsWrittenAndHighlighted) {
    excel::Sheet src = source_sheet({{"Salaire Brut", excel::Cell::of_number(2500)}});
    const auto plan = payroll::plan_fill(payroll::read_source_records(src, {}), salary_mapping(),
                                         payroll::DuplicatePolicy::LastWins);
    ASSERT_EQ(plan.writes.size(), 1u);
    EXPECT_TRUE(plan.warnings.empty());

    excel::Sheet target("Sheet1");
    const auto written = payroll::apply_plan(plan, target, payroll::kFillHighlight);

    const util::CellRef b3 = *util::parse_cell_ref("B3");
    EXPECT_EQ(written, (std::set<util::CellRef>{b3}));
    const excel::Cell *cell = target.get(b3);
    ASSERT_NE(cell, nullptr);
    EXPECT_EQ(cell->kind, excel::CellKind::Number);
    EXPECT_DOUBLE_EQ(cell->number, 2500.0);
    EXPECT_TRUE(cell->style.bold);
    EXPECT_EQ(cell->style.fill, 0xFFFF99u);
}

TEST(PlanFill, UnknownLabelIsSkippedWithWarning) {
    excel::Sheet src = source_sheet({{"Unknown Field", excel::Cell::of_number(100)}});
    const auto plan = payroll::plan_fill(payroll::read_source_records(src, {}), salary_mapping(),
                                         payroll::DuplicatePolicy::LastWins);
    EXPECT_TRUE(plan.writes.empty());
    ASSERT_EQ(plan.warnings.size(), 1u);
    EXPECT_EQ(plan.warnings[0].kind, payroll::WarningKind::UnmappedLabel);
    EXPECT_EQ(plan.warnings[0].label, "Unknown Field");
    EXPECT_EQ(plan.warnings[0].row, 1u);

    excel::Sheet target("Sheet1");
    target.set({0, 0}, excel::Cell::of_text("Rapport"));
    const auto before = target.cells();
    EXPECT_TRUE(payroll::apply_plan(plan, target, payroll::kFillHighlight).empty());
    EXPECT_EQ(target.cells(), before);
}

TEST(PlanFill, VariantSpellingsReachTheSameCell) {
    for (const char *label : {" Salaire Brut:", "salaire brut", "SALAIRE   BRUT.", "Salaire brut"}) {
        excel::Sheet src = source_sheet({{label, excel::Cell::of_number(42)}});
        const auto plan = payroll::plan_fill(payroll::read_source_records(src, {}), salary_mapping(),
                                             payroll::DuplicatePolicy::LastWins);
        ASSERT_EQ(plan.writes.size(), 1u) << label;
        EXPECT_EQ(plan.writes[0].cell, *util::parse_cell_ref("B3")) << label;
    }
}

TEST(PlanFill, BlankAndTextValuesAreWarnings) {
    excel::Sheet src = source_sheet({{"Salaire brut", excel::Cell{}},
                                     {"Net à payer", excel::Cell::of_text("n/a")}});
    const auto plan = payroll::plan_fill(payroll::read_source_records(src, {}), salary_mapping(),
                                         payroll::DuplicatePolicy::LastWins);
    EXPECT_TRUE(plan.writes.empty());
    ASSERT_NE(find_warning(plan, payroll::WarningKind::BlankValue), nullptr);
    const auto *text = find_warning(plan, payroll::WarningKind::NonNumericValue);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->detail, "n/a");
    EXPECT_EQ(payroll::describe(*text), "row 2: \"Net à payer\" value \"n/a\" is not a number");
}

TEST(PlanFill, DuplicatePolicies) {
    excel::Sheet src = source_sheet({{"Salaire brut", excel::Cell::of_number(1000)},
                                     {"Salaire Brut:", excel::Cell::of_number(2000)}});
    const auto recs = payroll::read_source_records(src, {});
    const auto mapping = salary_mapping();

    const auto last = payroll::plan_fill(recs, mapping, payroll::DuplicatePolicy::LastWins);
    ASSERT_EQ(last.writes.size(), 1u);
    EXPECT_DOUBLE_EQ(last.writes[0].value, 2000.0);
    EXPECT_EQ(last.writes[0].sourceRow, 2u);
    ASSERT_NE(find_warning(last, payroll::WarningKind::DuplicateLabel), nullptr);

    const auto first = payroll::plan_fill(recs, mapping, payroll::DuplicatePolicy::FirstWins);
    ASSERT_EQ(first.writes.size(), 1u);
    EXPECT_DOUBLE_EQ(first.writes[0].value, 1000.0);

    EXPECT_THROW(payroll::plan_fill(recs, mapping, payroll::DuplicatePolicy::Error), payroll::FillError);
}

TEST(PlanFill, AliasesShareDestination) {
    excel::Sheet src = source_sheet({{"Net à payer", excel::Cell::of_number(1900)},
                                     {"Net payé", excel::Cell::of_number(1950)}});
    const auto plan = payroll::plan_fill(payroll::read_source_records(src, {}), salary_mapping(),
                                         payroll::DuplicatePolicy::FirstWins);
    ASSERT_EQ(plan.writes.size(), 1u);
    EXPECT_EQ(plan.writes[0].cell, *util::parse_cell_ref("B4"));
    EXPECT_DOUBLE_EQ(plan.writes[0].value, 1900.0);
}

TEST(ApplyPlan, RepeatedRunsLeaveTheSameState) {
    excel::Sheet src = source_sheet({{"Salaire brut", excel::Cell::of_number(2500)},
                                     {"Net à payer", excel::Cell::of_number(1980)}});
    const auto plan = payroll::plan_fill(payroll::read_source_records(src, {}), salary_mapping(),
                                         payroll::DuplicatePolicy::LastWins);

    excel::Sheet target("Sheet1");
    excel::Cell templ = excel::Cell::of_text("placeholder");
    templ.style.numFormatId = 4;
    target.set(*util::parse_cell_ref("B3"), templ);

    payroll::apply_plan(plan, target, payroll::kFillHighlight);
    const auto once = target.cells();
    payroll::apply_plan(plan, target, payroll::kFillHighlight);
    EXPECT_EQ(target.cells(), once);
    EXPECT_EQ(target.get(*util::parse_cell_ref("B3"))->style.numFormatId, 4);
}

TEST(DuplicatePolicy, ParsesNames) {
    EXPECT_EQ(payroll::parse_duplicate_policy("last"), payroll::DuplicatePolicy::LastWins);
    EXPECT_EQ(payroll::parse_duplicate_policy("first"), payroll::DuplicatePolicy::FirstWins);
    EXPECT_EQ(payroll::parse_duplicate_policy("error"), payroll::DuplicatePolicy::Error);
    EXPECT_FALSE(payroll::parse_duplicate_policy("newest"));
    EXPECT_STREQ(payroll::to_string(payroll::DuplicatePolicy::FirstWins), "first");
}
