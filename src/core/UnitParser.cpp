/**
 * @file UnitParser.cpp
 * @brief Implementation of print-distance parsing with unit suffixes
 */

#include "UnitParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace keyforge {

double UnitParser::to_millimeters_factor(PrintUnit unit) {
    switch (unit) {
        case PrintUnit::MILLIMETERS: return 1.0;
        case PrintUnit::CENTIMETERS: return 10.0;
        case PrintUnit::INCHES:      return 25.4;
    }
    throw UnitParseError("Unknown print unit");
}

PrintUnit UnitParser::parse_unit_string(const std::string& unit_str) {
    std::string lower_unit = unit_str;
    std::transform(lower_unit.begin(), lower_unit.end(), lower_unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower_unit == "mm" || lower_unit == "millimeters") {
        return PrintUnit::MILLIMETERS;
    } else if (lower_unit == "cm" || lower_unit == "centimeters") {
        return PrintUnit::CENTIMETERS;
    } else if (lower_unit == "in" || lower_unit == "inches" || lower_unit == "\"") {
        return PrintUnit::INCHES;
    }

    throw UnitParseError("Unrecognized unit: '" + unit_str + "'. Supported units: mm, cm, in");
}

std::string UnitParser::unit_to_string(PrintUnit unit) {
    switch (unit) {
        case PrintUnit::MILLIMETERS: return "mm";
        case PrintUnit::CENTIMETERS: return "cm";
        case PrintUnit::INCHES:      return "in";
    }
    return "unknown";
}

std::pair<std::string, std::string> UnitParser::split_value_and_unit(const std::string& input) const {
    std::string trimmed = input;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\n\r"));
    trimmed.erase(trimmed.find_last_not_of(" \t\n\r") + 1);

    if (trimmed.empty()) {
        throw UnitParseError("Empty input string");
    }

    // Numeric part: optional sign, digits, at most one decimal point, optional exponent
    size_t pos = 0;
    if (trimmed[pos] == '+' || trimmed[pos] == '-') {
        ++pos;
    }
    bool found_digit = false;
    bool found_decimal = false;
    while (pos < trimmed.size()) {
        const char c = trimmed[pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            found_digit = true;
        } else if (c == '.' && !found_decimal) {
            found_decimal = true;
        } else {
            break;
        }
        ++pos;
    }
    if (found_digit && pos < trimmed.size() && (trimmed[pos] == 'e' || trimmed[pos] == 'E')) {
        size_t exp_pos = pos + 1;
        if (exp_pos < trimmed.size() && (trimmed[exp_pos] == '+' || trimmed[exp_pos] == '-')) {
            ++exp_pos;
        }
        if (exp_pos < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[exp_pos]))) {
            while (exp_pos < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[exp_pos]))) {
                ++exp_pos;
            }
            pos = exp_pos;
        }
    }

    if (!found_digit) {
        throw UnitParseError("No numeric value in '" + input + "'");
    }

    std::string unit = trimmed.substr(pos);
    unit.erase(0, unit.find_first_not_of(" \t"));
    return {trimmed.substr(0, pos), unit};
}

ParsedValue UnitParser::parse_print_distance(const std::string& input) const {
    auto [number, unit_str] = split_value_and_unit(input);

    double numeric = 0.0;
    try {
        numeric = std::stod(number);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid number '" + number + "'");
    }

    const bool explicit_unit = !unit_str.empty();
    const PrintUnit unit = explicit_unit ? parse_unit_string(unit_str) : default_unit_;
    const double millimeters = numeric * to_millimeters_factor(unit);

    if (!std::isfinite(millimeters)) {
        throw UnitParseError("Value out of range: '" + input + "'");
    }

    return ParsedValue{millimeters, unit, explicit_unit};
}

} // namespace keyforge
