#pragma once

/**
 * @file UnitParser.hpp
 * @brief Distance values with optional unit suffixes
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <stdexcept>
#include <string>
#include <utility>

namespace habitat {

/**
 * @brief Exception thrown when unit parsing fails
 */
class UnitParseError : public std::runtime_error {
public:
    explicit UnitParseError(const std::string& message)
        : std::runtime_error("Unit parsing error: " + message) {}
};

/**
 * @brief Unit types for distance measurements
 */
enum class DistanceUnit {
    METERS,      // m
    KILOMETERS,  // km
    FEET,        // ft
    MILES        // mi
};

/**
 * @brief Result of parsing a value with units
 */
struct ParsedValue {
    double value;               // Numeric value in canonical units
    DistanceUnit original_unit; // Unit that was parsed
    bool had_explicit_unit;     // Whether unit was explicitly specified

    ParsedValue(double v, DistanceUnit u, bool explicit_unit = false)
        : value(v), original_unit(u), had_explicit_unit(explicit_unit) {}
};

/**
 * @brief Parses distance values with optional unit suffixes
 *
 * The analysis works in meters (the linear unit of projected river
 * networks), so a bare number is taken as-is and a suffixed one is
 * converted to meters:
 *   "4000"   -> 4000.0
 *   "4km"    -> 4000.0
 *   "1.9 km" -> 1900.0
 *   "65ft"   -> 19.812
 */
class UnitParser {
public:
    UnitParser() = default;

    /**
     * @brief Parse a distance value into meters
     *
     * @param input String to parse (e.g., "200", "5km", "10mi")
     * @return Parsed value expressed in meters
     * @throws UnitParseError on empty input, bad number or unknown unit
     */
    ParsedValue parse_distance(const std::string& input) const;

    /**
     * @brief Convert distance between units
     */
    static double convert_distance(double value, DistanceUnit from_unit, DistanceUnit to_unit);

    /**
     * @brief Get conversion factor to meters
     */
    static double to_meters_factor(DistanceUnit unit);

    /**
     * @brief Parse unit string to DistanceUnit enum
     * @throws UnitParseError if unit string is not recognized
     */
    static DistanceUnit parse_unit_string(const std::string& unit_str);

    static std::string unit_to_string(DistanceUnit unit);

private:
    /**
     * @brief Split numeric value and unit suffix
     *
     *   "200"    -> ("200", "")
     *   "5km"    -> ("5", "km")
     *   "10.5 mi" -> ("10.5", "mi")
     */
    std::pair<std::string, std::string> split_value_and_unit(const std::string& input) const;
};

} // namespace habitat
