#pragma once

#include <string>

namespace stratai {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

bool ends_with(const std::string& s, const std::string& suffix);

// Escapes a string for safe inclusion in a CSV cell.
//
// If the string contains a comma, quote, or newline, the result will be wrapped
// in double-quotes and any internal quotes will be doubled.
std::string csv_escape(const std::string& s);

// Fixed-precision formatting for reports ("0.767").
std::string format_fixed(double v, int decimals = 3);

} // namespace stratai
