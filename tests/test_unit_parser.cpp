/**
 * @file test_unit_parser.cpp
 * @brief Tests for distance parsing with unit suffixes
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "UnitParser.hpp"
#include <gtest/gtest.h>

using namespace habitat;

TEST(UnitParserTest, BareNumberIsTakenInMeters) {
    UnitParser parser;
    auto parsed = parser.parse_distance("4000");
    EXPECT_DOUBLE_EQ(parsed.value, 4000.0);
    EXPECT_FALSE(parsed.had_explicit_unit);
    EXPECT_EQ(parsed.original_unit, DistanceUnit::METERS);
}

TEST(UnitParserTest, SuffixedValuesAreConverted) {
    UnitParser parser;
    EXPECT_DOUBLE_EQ(parser.parse_distance("4km").value, 4000.0);
    EXPECT_DOUBLE_EQ(parser.parse_distance("1.9 km").value, 1900.0);
    EXPECT_NEAR(parser.parse_distance("65ft").value, 19.812, 1e-9);
    EXPECT_DOUBLE_EQ(parser.parse_distance("1mi").value, 1609.344);
    EXPECT_DOUBLE_EQ(parser.parse_distance("20 metres").value, 20.0);
    EXPECT_TRUE(parser.parse_distance("4km").had_explicit_unit);
}

TEST(UnitParserTest, ExponentAndSign) {
    UnitParser parser;
    EXPECT_DOUBLE_EQ(parser.parse_distance("2e3").value, 2000.0);
    EXPECT_DOUBLE_EQ(parser.parse_distance("-5").value, -5.0);
    EXPECT_DOUBLE_EQ(parser.parse_distance("  50  ").value, 50.0);
}

TEST(UnitParserTest, ConvertsBetweenUnits) {
    EXPECT_NEAR(UnitParser::convert_distance(3.048, DistanceUnit::METERS, DistanceUnit::FEET), 10.0, 1e-9);
    EXPECT_DOUBLE_EQ(UnitParser::convert_distance(2.5, DistanceUnit::KILOMETERS, DistanceUnit::METERS), 2500.0);
    EXPECT_EQ(UnitParser().parse_distance("3ft").original_unit, DistanceUnit::FEET);
}

TEST(UnitParserTest, RejectsMalformedInput) {
    UnitParser parser;
    EXPECT_THROW(parser.parse_distance(""), UnitParseError);
    EXPECT_THROW(parser.parse_distance("   "), UnitParseError);
    EXPECT_THROW(parser.parse_distance("km"), UnitParseError);
    EXPECT_THROW(parser.parse_distance("5 parsecs"), UnitParseError);
}

TEST(UnitParserTest, UnitNames) {
    EXPECT_EQ(UnitParser::parse_unit_string("Meters"), DistanceUnit::METERS);
    EXPECT_EQ(UnitParser::parse_unit_string("miles"), DistanceUnit::MILES);
    EXPECT_EQ(UnitParser::unit_to_string(DistanceUnit::KILOMETERS), "km");
    EXPECT_DOUBLE_EQ(UnitParser::convert_distance(1.0, DistanceUnit::MILES, DistanceUnit::KILOMETERS), 1.609344);
}
