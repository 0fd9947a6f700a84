/**
 * @file ValidationError.hpp
 * @brief Errors that prevent a scan from starting.
 */

#pragma once

#include <string>

namespace devsweep::core {

/**
 * @brief Kind of configuration problem found before any work is scheduled.
 */
enum class ValidationErrorKind : int {
    InvalidIP = 0,          ///< Malformed dotted quad or octet > 255
    InvalidRange = 1,       ///< Start address above end address, or over the target limit
    InvalidPort = 2,        ///< Port outside [1,65535]
    InvalidPortSpec = 3,    ///< Port specification does not parse
    InvalidThreadCount = 4, ///< Thread count below 1
    InvalidTimeout = 5,     ///< Timeout outside [0.1,10.0] seconds
    UnknownProfile = 6      ///< Profile name not in the fixed table
};

/**
 * @brief A configuration error with a message suitable for display.
 */
struct ValidationError {
    ValidationErrorKind kind{ValidationErrorKind::InvalidIP};
    std::string message;

    [[nodiscard]] std::string kindToString() const { return kindToString(kind); }

    static std::string kindToString(ValidationErrorKind kind);

    bool operator==(const ValidationError& other) const = default;
};

} // namespace devsweep::core
