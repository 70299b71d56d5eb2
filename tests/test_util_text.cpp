#include <gtest/gtest.h>

#include "cell_ref.hpp"
#include "util_text.hpp"

#include <string>
#include <vector>

TEST(NormalizeLabel, TrimsCasesAndStripsTrailingPunctuation) {
    EXPECT_EQ(util::normalize_label(" Gross Salary:"), "gross salary");
    EXPECT_EQ(util::normalize_label("gross salary"), "gross salary");
    EXPECT_EQ(util::normalize_label("GROSS    salary  "), "gross salary");
    EXPECT_EQ(util::normalize_label("Salaire Brut"), "salaire brut");
    EXPECT_EQ(util::normalize_label("Net à payer."), "net a payer");
}

TEST(NormalizeLabel, RemovesAccentsAndOddWhitespace) {
    EXPECT_EQ(util::normalize_label("Prélèvement à la source"), "prelevement a la source");
    EXPECT_EQ(util::normalize_label("Cotisations\xC2\xA0salari\xC3\xA9"), "cotisations salarie");
    EXPECT_EQ(util::normalize_label("\tTotal\npatronal\r"), "total patronal");
}

TEST(NormalizeLabel, KeepsInnerSeparators) {
    EXPECT_EQ(util::normalize_label("Cot. salarié"), "cot. salarie");
    EXPECT_EQ(util::normalize_label("CSG/CRDS non-déductible"), "csg/crds non-deductible");
    EXPECT_EQ(util::normalize_label("Avantages (en nature)"), "avantages en nature");
}

TEST(NormalizeLabel, EmptyAndPunctuationOnly) {
    EXPECT_EQ(util::normalize_label(""), "");
    EXPECT_EQ(util::normalize_label("   "), "");
    EXPECT_EQ(util::normalize_label(" :; -- "), "");
}

TEST(NormalizeLabel, IsIdempotent) {
    const std::vector<std::string> samples = {
        " Gross Salary:", "Salaire Brut", "Net à payer.", "Cot. salarié", "a : b",
        "x -", "Total\xC2\xA0" "salarial", "É.T.É", "  __ini__  ", "PAS/"};
    for (const auto &s : samples) {
        const std::string once = util::normalize_label(s);
        EXPECT_EQ(util::normalize_label(once), once) << "input: " << s;
    }
}

TEST(EmployeeId, PadsDigitsToWidth) {
    EXPECT_EQ(util::normalize_employee_id("14", 5), "00014");
    EXPECT_EQ(util::normalize_employee_id("EMP-0014", 5), "00014");
    EXPECT_EQ(util::normalize_employee_id("123456", 5), "123456");
    EXPECT_EQ(util::normalize_employee_id("n/a", 5), "");
}

TEST(EmployeeId, WidthIsLongestDigitRun) {
    EXPECT_EQ(util::employee_id_width({"00014", "7"}), 5u);
    EXPECT_EQ(util::employee_id_width({"1234567", ""}), 7u);
    EXPECT_EQ(util::employee_id_width({}), 5u);
    EXPECT_EQ(util::employee_id_width({"abc"}), 5u);
}

TEST(Numbers, ParsesLocaleStyles) {
    EXPECT_DOUBLE_EQ(*util::parse_number("2500"), 2500.0);
    EXPECT_DOUBLE_EQ(*util::parse_number(" 1234.5 "), 1234.5);
    EXPECT_DOUBLE_EQ(*util::parse_number("2 500,50"), 2500.5);
    EXPECT_DOUBLE_EQ(*util::parse_number("1\xC2\xA0" "980,00"), 1980.0);
    EXPECT_DOUBLE_EQ(*util::parse_number("-12"), -12.0);
    EXPECT_FALSE(util::parse_number(""));
    EXPECT_FALSE(util::parse_number("abc"));
    EXPECT_FALSE(util::parse_number("12abc"));
    EXPECT_FALSE(util::parse_number("1,2,3"));
    EXPECT_FALSE(util::parse_number("0x1A"));
    EXPECT_FALSE(util::parse_number("1e3"));
    EXPECT_FALSE(util::parse_number("inf"));
    EXPECT_FALSE(util::parse_number("12-"));
}

TEST(Numbers, FormatsIntegralValuesWithoutFraction) {
    EXPECT_EQ(util::format_number(2500.0), "2500");
    EXPECT_EQ(util::format_number(14.0), "14");
    EXPECT_EQ(util::format_number(2.5), "2.5");
}

TEST(CellRef, ParsesA1Addresses) {
    auto b3 = util::parse_cell_ref("B3");
    ASSERT_TRUE(b3);
    EXPECT_EQ(b3->row, 2u);
    EXPECT_EQ(b3->col, 1u);

    auto anchored = util::parse_cell_ref("$aa$10");
    ASSERT_TRUE(anchored);
    EXPECT_EQ(anchored->row, 9u);
    EXPECT_EQ(anchored->col, 26u);

    auto last = util::parse_cell_ref("XFD1048576");
    ASSERT_TRUE(last);
    EXPECT_EQ(last->col, util::kMaxCols - 1);
    EXPECT_EQ(last->row, util::kMaxRows - 1);
}

TEST(CellRef, RejectsInvalidAddresses) {
    for (const char *bad : {"", "B", "3", "B0", "XFE1", "A1048577", "A1B", "B-3", "AAAA1"}) {
        EXPECT_FALSE(util::parse_cell_ref(bad)) << bad;
    }
}

TEST(CellRef, FormatsColumnsAndAddresses) {
    EXPECT_EQ(util::column_letters(0), "A");
    EXPECT_EQ(util::column_letters(25), "Z");
    EXPECT_EQ(util::column_letters(26), "AA");
    EXPECT_EQ(util::column_letters(16383), "XFD");
    EXPECT_EQ(util::to_a1({2, 1}), "B3");
    EXPECT_EQ(*util::parse_column("ab"), 27u);
    EXPECT_FALSE(util::parse_column("A1"));
}

TEST(CellRef, ShiftsRelativeReferencesInFormulas) {
    EXPECT_EQ(util::shift_formula("A1+B1", 1, 0), "A2+B2");
    EXPECT_EQ(util::shift_formula("$A$1*B1", 2, 1), "$A$1*C3");
    EXPECT_EQ(util::shift_formula("A$1+$A1", 1, 1), "B$1+$A2");
    EXPECT_EQ(util::shift_formula("SUM(A1:A3)/LOG10(B1)", 1, 0), "SUM(A2:A4)/LOG10(B2)");
    EXPECT_EQ(util::shift_formula("Feuil1!C5&\"A1\"", 0, 1), "Feuil1!D5&\"A1\"");
    EXPECT_EQ(util::shift_formula("'Sheet A1'!A1*1.5", 1, 0), "'Sheet A1'!A2*1.5");
    EXPECT_EQ(util::shift_formula("A1", -1, 0), "#REF!");
}
