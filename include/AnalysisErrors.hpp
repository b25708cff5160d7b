#pragma once

/**
 * @file AnalysisErrors.hpp
 * @brief Exception types raised by the habitat suitability pipeline
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <stdexcept>
#include <string>

namespace habitat {

/**
 * @brief Base class for every error raised by the analysis pipeline
 */
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief No coverage polygons were supplied (fatal, aborts before any segment)
 */
class EmptyInputError : public AnalysisError {
public:
    explicit EmptyInputError(const std::string& message)
        : AnalysisError("Empty input: " + message) {}
};

/**
 * @brief A line part has fewer than 2 points, zero length or non-finite coordinates (part is skipped)
 */
class DegenerateLineError : public AnalysisError {
public:
    explicit DegenerateLineError(const std::string& message)
        : AnalysisError("Degenerate line: " + message) {}
};

/**
 * @brief Configuration rejected by InputValidator (fatal at startup)
 */
class InvalidConfigurationError : public AnalysisError {
public:
    explicit InvalidConfigurationError(const std::string& message)
        : AnalysisError(message) {}
};

/**
 * @brief An input or output dataset could not be opened, read or written
 */
class DatasetError : public AnalysisError {
public:
    explicit DatasetError(const std::string& message)
        : AnalysisError("Dataset error: " + message) {}
};

/**
 * @brief Failure inside the geometry backend
 *
 * Carries the identity of the offending feature once it is known. The
 * kernel throws without an id; callers that know the feature rethrow with
 * with_feature().
 */
class GeometryError : public AnalysisError {
public:
    explicit GeometryError(const std::string& message, const std::string& feature_id = "")
        : AnalysisError(feature_id.empty() ? "Geometry error: " + message
                                           : "Geometry error in feature '" + feature_id + "': " + message),
          reason_(message), feature_id_(feature_id) {}

    const std::string& reason() const { return reason_; }
    const std::string& feature_id() const { return feature_id_; }

    GeometryError with_feature(const std::string& feature_id) const {
        return GeometryError(reason_, feature_id);
    }

private:
    std::string reason_;
    std::string feature_id_;
};

} // namespace habitat
