#pragma once
#include <optional>
#include <string>
#include <vector>

namespace vclimb {

// Tiny helpers shared by the key,value file loaders. No quoted fields.
std::string trim(std::string s);
std::string to_lower(std::string s);
std::vector<std::string> split_fields(const std::string& line, char sep = ',');

// Whole-string parse; nullopt for empty, trailing junk or non-finite values.
std::optional<double> parse_double(const std::string& s);

} // namespace vclimb
