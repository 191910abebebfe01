#pragma once
#include <optional>
#include <string>

namespace lotbook::utils {

std::string trim(const std::string& text);
std::string to_lower(const std::string& text);
std::string to_upper(const std::string& text);

/**
 * Parse a money or quantity cell.
 *
 * Strips currency symbols, thousands separators and whitespace, and treats
 * "(12.50)" as -12.50. Returns nullopt for a blank cell and throws
 * std::invalid_argument when something non-numeric remains.
 */
std::optional<double> parse_amount(const std::string& text);

/**
 * Parse a ratio cell. "40%" gives 0.40, "0.4" gives 0.4.
 * Same blank / error behavior as parse_amount.
 */
std::optional<double> parse_ratio(const std::string& text);

} // namespace lotbook::utils
