#pragma once
#include <string>
#include <vector>

namespace swa::csv {

std::string trim(std::string s);

// Simple CSV: no quoted fields.
std::vector<std::string> split_line(const std::string& line);

// Whole-field double parse; false on trailing garbage or empty input.
bool to_double(const std::string& s, double& out);

// True for blank lines and '#' comments.
bool is_skippable(const std::string& trimmed_line);

} // namespace swa::csv
