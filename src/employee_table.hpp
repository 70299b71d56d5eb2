#pragma once
#include "fill_plan.hpp"
#include "models.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace payroll {

// Source sheet layout: one block of columns per employee, ids on a single row
// and field labels down one column. All coordinates are zero-based.
struct BlockLayout {
    std::uint32_t idRow = 2;         // row 3
    std::uint32_t codeCol = 0;       // column A
    std::uint32_t fieldCol = 1;      // column B
    std::uint32_t fieldFirstRow = 4; // row 5
    std::uint32_t blockWidth = 3;
    std::uint32_t maxCols = 120;
};

// Target sheet layout: a header row of field labels and employee ids down one column.
struct TargetLayout {
    std::uint32_t headerRow = 0;
    std::uint32_t idCol = 0;
    std::uint32_t firstDataRow = 1;
};

using EmployeeRecord = std::map<std::string, double>;             // canonical field -> value
using EmployeeRecords = std::map<std::string, EmployeeRecord>;    // employee id -> fields

struct TargetIndex {
    std::map<std::string, std::uint32_t> rows;    // normalized employee id -> row
    std::map<std::string, std::uint32_t> columns; // normalized header -> column
    std::uint32_t idCol = 0;
    std::size_t idWidth = 5;
};

TargetIndex index_target(const excel::Sheet &target, const TargetLayout &layout);

// Normalized employee id -> first column of its block.
std::map<std::string, std::uint32_t> employee_blocks(const excel::Sheet &src, const BlockLayout &layout,
                                                     std::size_t idWidth);

EmployeeRecords extract_employee_records(const excel::Sheet &src, const BlockLayout &layout,
                                         const std::map<std::string, std::string> &aliases,
                                         std::size_t idWidth);

// `fieldFilter` holds canonical labels to fill; empty fills every shared field.
FillPlan plan_table_fill(const EmployeeRecords &records, const TargetIndex &index,
                         const std::set<std::string> &fieldFilter);

// Clears values and styles of the data area (right of the id column, below the header).
void clear_table(excel::Sheet &target, const TargetLayout &layout);

} // namespace payroll
