#pragma once

#include <string>

namespace granddao {

std::string to_lower(std::string s);

// Strips leading/trailing ASCII whitespace.
std::string trim_copy(const std::string& s);

// Fixed-point formatting for status lines ("12.50").
std::string format_fixed(double v, int decimals);

} // namespace granddao
