#include <lotbook/utils/string_utils.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace lotbook::utils {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string to_lower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::optional<double> parse_amount(const std::string& text) {
    std::string cleaned = trim(text);
    if (cleaned.empty()) {
        return std::nullopt;
    }

    bool negative = false;
    if (cleaned.size() >= 2 && cleaned.front() == '(' && cleaned.back() == ')') {
        negative = true;
        cleaned = cleaned.substr(1, cleaned.size() - 2);
    }

    std::string digits;
    digits.reserve(cleaned.size());
    for (char c : cleaned) {
        if (c == '$' || c == ',' || c == ' ' || c == '\t') {
            continue;
        }
        digits.push_back(c);
    }
    if (digits.empty()) {
        return std::nullopt;
    }

    const char* begin = digits.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value)) {
        throw std::invalid_argument("not a number: '" + text + "'");
    }
    return negative ? -value : value;
}

std::optional<double> parse_ratio(const std::string& text) {
    std::string cleaned = trim(text);
    bool percent = false;
    if (!cleaned.empty() && cleaned.back() == '%') {
        percent = true;
        cleaned.pop_back();
    }

    auto value = parse_amount(cleaned);
    if (value && percent) {
        return *value / 100.0;
    }
    return value;
}

} // namespace lotbook::utils
