#pragma once
#include <optional>
#include <string>
#include <vector>

namespace rpace {

// Tiny CSV helpers shared by the loaders. No quoted fields.
std::string trim(std::string s);
std::vector<std::string> split_csv_line(const std::string& line);

// Whole-field number parse; nullopt on empty, trailing junk or non-number.
std::optional<double> parse_double(const std::string& s);

} // namespace rpace
