#pragma once

/**
 * @file UnitParser.hpp
 * @brief Parses print dimensions with optional unit suffixes
 *
 * Keychain dimensions are millimetres internally. Inputs may carry a
 * suffix: "3", "3mm", "0.3cm", "0.125in".
 */

#include <stdexcept>
#include <string>
#include <utility>

namespace keyforge {

/**
 * @brief Exception thrown when a dimension cannot be parsed
 */
class UnitParseError : public std::runtime_error {
public:
    explicit UnitParseError(const std::string& message)
        : std::runtime_error("Unit parsing error: " + message) {}
};

/**
 * @brief Print distance units
 */
enum class PrintUnit {
    MILLIMETERS, // mm
    CENTIMETERS, // cm
    INCHES       // in
};

/**
 * @brief Result of parsing a value with units
 */
struct ParsedValue {
    double value;              // Value in millimetres
    PrintUnit original_unit;   // Unit that was parsed (or the default)
    bool had_explicit_unit;    // Whether a suffix was present
};

/**
 * @brief Converts "<number>[unit]" strings to millimetres
 */
class UnitParser {
public:
    UnitParser() = default;
    explicit UnitParser(PrintUnit default_unit) : default_unit_(default_unit) {}

    /**
     * @brief Parse a print distance
     *
     * @param input e.g. "15", "2.5mm", "0.3cm", "0.125in"
     * @return Value in millimetres
     * @throws UnitParseError on empty input, trailing garbage, unknown unit
     *         or a non-finite number
     *
     * Examples:
     *   parse_print_distance("3")      -> 3.0
     *   parse_print_distance("0.5cm")  -> 5.0
     *   parse_print_distance("1in")    -> 25.4
     */
    ParsedValue parse_print_distance(const std::string& input) const;

    static double to_millimeters_factor(PrintUnit unit);

    /**
     * @throws UnitParseError if the unit string is not recognized
     */
    static PrintUnit parse_unit_string(const std::string& unit_str);

    static std::string unit_to_string(PrintUnit unit);

private:
    PrintUnit default_unit_ = PrintUnit::MILLIMETERS;

    /**
     * @brief Split "5.5mm" into ("5.5", "mm")
     */
    std::pair<std::string, std::string> split_value_and_unit(const std::string& input) const;
};

} // namespace keyforge
