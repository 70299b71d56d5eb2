#pragma once
#include "field_mapping.hpp"
#include "fill_plan.hpp"
#include "models.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace payroll {

// Where (label, value) pairs live on the source sheet. Zero-based.
struct SourceLayout {
    std::uint32_t labelCol = 1; // B
    std::uint32_t valueCol = 2; // C
    std::uint32_t firstRow = 0;
    std::optional<std::uint32_t> lastRow; // inclusive; defaults to the last used row
};

struct SourceRecord {
    std::uint32_t row = 0; // 1-based
    std::string label;
    std::optional<double> value;
    std::string rawValue; // set when the cell holds text that is not a number
};

// What to do when two records land on the same destination cell.
enum class DuplicatePolicy { LastWins, FirstWins, Error };

std::optional<DuplicatePolicy> parse_duplicate_policy(const std::string &name);
const char *to_string(DuplicatePolicy p);

std::vector<SourceRecord> read_source_records(const excel::Sheet &src, const SourceLayout &layout);

// Pure: resolves each record against `mapping`. Throws FillError for a
// duplicate under DuplicatePolicy::Error.
FillPlan plan_fill(const std::vector<SourceRecord> &records, const FieldMapping &mapping,
                   DuplicatePolicy policy);

} // namespace payroll
