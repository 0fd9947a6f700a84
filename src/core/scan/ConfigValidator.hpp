/**
 * @file ConfigValidator.hpp
 * @brief Gatekeeper between raw configuration and the scanning engine.
 */

#pragma once

#include "core/types/ScanConfig.hpp"
#include "core/types/ValidationError.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace devsweep::core {

/// Either a configuration the engine can run, or the reason it cannot.
using ValidationResult = std::variant<ValidatedConfig, ValidationError>;

/// Either a resolved port list, or the reason the specification is invalid.
using PortSpecResult = std::variant<std::vector<uint16_t>, ValidationError>;

/**
 * @brief Validates sweep configuration before any work is scheduled.
 *
 * Pure apart from two log lines: a warning when the thread count is
 * clamped, and a warning when the sweep is unusually large.
 */
class ConfigValidator {
public:
    static constexpr int MIN_THREADS = 1;
    static constexpr int MAX_THREADS = 200;
    static constexpr double MIN_TIMEOUT_SECONDS = 0.1;
    static constexpr double MAX_TIMEOUT_SECONDS = 10.0;
    static constexpr uint64_t LARGE_SWEEP_TARGETS = 65536;

    /**
     * @brief Validates a configuration.
     *
     * A profile, when named, replaces threads and timeout before the bounds
     * are checked. Thread counts above MAX_THREADS are clamped rather than
     * rejected. An empty port specification selects the default ports of
     * the enabled services.
     *
     * @param config The raw configuration.
     * @return The validated configuration or the first error found.
     */
    static ValidationResult validate(const ScanConfig& config);

    /**
     * @brief Resolves a port specification.
     *
     * Accepts a single port ("5555"), an inclusive range ("5555-5557") or a
     * comma list whose items are ports or ranges ("22,5555-5557"). Order is
     * preserved and duplicates are dropped. Whitespace around items is
     * ignored; an empty specification yields an empty list.
     *
     * @param spec The specification string.
     * @return Ports in the given order, or InvalidPort / InvalidPortSpec.
     */
    static PortSpecResult parsePortSpec(const std::string& spec);

    /**
     * @brief Checks a dotted-quad IPv4 address.
     */
    [[nodiscard]] static bool isValidIp(const std::string& ip);

    /**
     * @brief Checks a port number is in [1,65535].
     */
    [[nodiscard]] static bool isValidPort(int64_t port) { return port >= 1 && port <= 65535; }
};

} // namespace devsweep::core
