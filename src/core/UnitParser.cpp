/**
 * @file UnitParser.cpp
 * @brief Distance parsing for command line and config file values
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "UnitParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace habitat {

// ============================================================================
// UNIT CONVERSION
// ============================================================================

double UnitParser::to_meters_factor(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:     return 1.0;
        case DistanceUnit::KILOMETERS: return 1000.0;
        case DistanceUnit::FEET:       return 0.3048;
        case DistanceUnit::MILES:      return 1609.344;
    }
    throw UnitParseError("Unknown distance unit in to_meters_factor");
}

double UnitParser::convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit) {
    if (from_unit == to_unit) {
        return value;
    }
    return value * to_meters_factor(from_unit) / to_meters_factor(to_unit);
}

DistanceUnit UnitParser::parse_unit_string(const std::string& unit_str) {
    std::string lower_unit = unit_str;
    std::transform(lower_unit.begin(), lower_unit.end(), lower_unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower_unit == "m" || lower_unit == "meters" || lower_unit == "metres") {
        return DistanceUnit::METERS;
    } else if (lower_unit == "km" || lower_unit == "kilometers" || lower_unit == "kilometres") {
        return DistanceUnit::KILOMETERS;
    } else if (lower_unit == "ft" || lower_unit == "feet") {
        return DistanceUnit::FEET;
    } else if (lower_unit == "mi" || lower_unit == "miles") {
        return DistanceUnit::MILES;
    }

    throw UnitParseError("Unrecognized unit: '" + unit_str + "'. Supported units: m, km, ft, mi");
}

std::string UnitParser::unit_to_string(DistanceUnit unit) {
    switch (unit) {
        case DistanceUnit::METERS:     return "m";
        case DistanceUnit::KILOMETERS: return "km";
        case DistanceUnit::FEET:       return "ft";
        case DistanceUnit::MILES:      return "mi";
    }
    return "unknown";
}

// ============================================================================
// VALUE AND UNIT SPLITTING
// ============================================================================

std::pair<std::string, std::string> UnitParser::split_value_and_unit(const std::string& input) const {
    const auto first = input.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        throw UnitParseError("Empty input string");
    }
    const auto last = input.find_last_not_of(" \t\n\r");
    const std::string trimmed = input.substr(first, last - first + 1);

    // Numeric part: optional sign, digits, one decimal point, optional exponent
    size_t pos = 0;
    if (trimmed[pos] == '+' || trimmed[pos] == '-') {
        ++pos;
    }
    bool found_digit = false;
    bool found_decimal = false;
    while (pos < trimmed.size()) {
        const unsigned char c = static_cast<unsigned char>(trimmed[pos]);
        if (std::isdigit(c)) {
            found_digit = true;
        } else if (c == '.' && !found_decimal) {
            found_decimal = true;
        } else {
            break;
        }
        ++pos;
    }
    if (!found_digit) {
        throw UnitParseError("No numeric value found in: '" + input + "'");
    }
    if (pos + 1 < trimmed.size() && (trimmed[pos] == 'e' || trimmed[pos] == 'E')) {
        size_t exp = pos + 1;
        if (trimmed[exp] == '+' || trimmed[exp] == '-') {
            ++exp;
        }
        if (exp < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[exp]))) {
            while (exp < trimmed.size() && std::isdigit(static_cast<unsigned char>(trimmed[exp]))) {
                ++exp;
            }
            pos = exp;
        }
    }

    std::string unit_str = trimmed.substr(pos);
    const auto unit_first = unit_str.find_first_not_of(" \t");
    unit_str = unit_first == std::string::npos ? "" : unit_str.substr(unit_first);

    return {trimmed.substr(0, pos), unit_str};
}

// ============================================================================
// DISTANCE PARSING
// ============================================================================

ParsedValue UnitParser::parse_distance(const std::string& input) const {
    auto [value_str, unit_str] = split_value_and_unit(input);

    double value;
    try {
        value = std::stod(value_str);
    } catch (const std::exception&) {
        throw UnitParseError("Invalid numeric value: '" + value_str + "'");
    }
    if (!std::isfinite(value)) {
        throw UnitParseError("Distance is not finite: '" + input + "'");
    }

    const bool had_explicit_unit = !unit_str.empty();
    const DistanceUnit source_unit = had_explicit_unit ? parse_unit_string(unit_str) : DistanceUnit::METERS;

    return ParsedValue(convert_distance(value, source_unit, DistanceUnit::METERS), source_unit, had_explicit_unit);
}

} // namespace habitat
