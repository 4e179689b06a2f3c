#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace unitpulse {

inline constexpr std::string_view kUnitsColumn = "Units";

// Index of the "Units" header cell: exact match first, then case-insensitive.
std::optional<size_t> find_units_column(const std::vector<std::string>& header);

// Sums the Units column of a tab-separated sales report.
//
// Returns nullopt only when there is no header or the header lacks a Units
// column. Short rows, blank cells and non-integer cells are skipped, so a
// report whose rows are all unusable yields 0. Refund rows carry negative
// units and are netted in; the total is clamped at zero.
std::optional<std::int64_t> parse_units(std::string_view tsv);

std::vector<std::string> split_tabs(std::string_view line);

} // namespace unitpulse
