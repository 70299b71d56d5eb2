#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace util {
std::string trim(const std::string &s);
std::string normalize_label(const std::string &s);
std::string normalize_employee_id(const std::string &raw, std::size_t width);
std::size_t employee_id_width(const std::vector<std::string> &ids);
std::optional<double> parse_number(const std::string &text);
std::string format_number(double value);
bool iequals(const std::string &a, const std::string &b);
}
