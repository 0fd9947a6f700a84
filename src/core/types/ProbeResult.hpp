/**
 * @file ProbeResult.hpp
 * @brief Outcome of probing a single target.
 *
 * This file defines the device classification, the per-target error kinds
 * and the result record handed from a probe to the aggregator.
 */

#pragma once

#include "core/types/Target.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace devsweep::core {

/**
 * @brief Classification of a probed target.
 */
enum class DeviceType : int {
    Unknown = 0,    ///< Port open without a recognized handshake, or closed
    ADB = 1,        ///< Android Debug Bridge (device or host server)
    SSH = 2,        ///< SSH server banner seen
    Telnet = 3,     ///< Telnet negotiation or banner seen
    Unreachable = 4 ///< Host did not answer the reachability check
};

/**
 * @brief Failure local to one target.
 *
 * Probe errors are recorded in the result and never abort the scan.
 */
enum class ProbeError : int {
    ConnectionRefused = 0, ///< Peer actively refused the connection
    ConnectionTimeout = 1, ///< No connect completion before the timeout
    HandshakeTimeout = 2,  ///< Connected, but no handshake reply in time
    UnreachableHost = 3,   ///< Reachability check or routing failed
    ProbeFailed = 4        ///< The probe itself failed unexpectedly
};

/**
 * @brief Result of probing one target.
 *
 * Produced exactly once per target and immutable once recorded.
 */
struct ProbeResult {
    Target target;                          ///< The probed (address, port)
    std::optional<bool> reachable;          ///< Reachability result, nullopt if ping was skipped
    bool open{false};                       ///< Whether the TCP connect succeeded
    DeviceType deviceType{DeviceType::Unknown}; ///< Classification of the service
    std::chrono::microseconds elapsed{0};   ///< Total time spent on this target
    std::optional<std::string> banner;      ///< Sanitized, length-capped handshake snippet
    std::optional<ProbeError> error;        ///< Per-target error, if any
    std::chrono::system_clock::time_point timestamp; ///< When the probe finished

    /**
     * @brief Returns the elapsed time in milliseconds.
     */
    [[nodiscard]] double elapsedMs() const {
        return static_cast<double>(elapsed.count()) / 1000.0;
    }

    /**
     * @brief Checks whether the target was classified as a known service.
     */
    [[nodiscard]] bool isKnownService() const {
        return deviceType == DeviceType::ADB || deviceType == DeviceType::SSH ||
               deviceType == DeviceType::Telnet;
    }

    /**
     * @brief Converts this result's device type to a string.
     * @return String representation (e.g., "ADB", "Unknown").
     */
    [[nodiscard]] std::string deviceTypeToString() const;

    static std::string deviceTypeToString(DeviceType type);

    /**
     * @brief Parses a device type string.
     * @param str The string to parse (e.g., "SSH").
     * @return The matching DeviceType, Unknown if not recognized.
     */
    static DeviceType deviceTypeFromString(const std::string& str);

    static std::string errorToString(ProbeError error);

    bool operator==(const ProbeResult& other) const = default;
};

} // namespace devsweep::core
