/**
 * @file ScanConfig.hpp
 * @brief Raw and validated sweep configuration.
 *
 * ScanConfig is what a settings store or the command line produces.
 * ValidatedConfig is what the validator hands to the scanning engine; its
 * fields are always within their documented bounds.
 */

#pragma once

#include "core/types/ScanProfile.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devsweep::core {

/**
 * @brief Service selection and probe options.
 */
struct ScanFlags {
    bool scanAdb{true};    ///< Attempt ADB handshakes on 5037/5555
    bool scanSsh{true};    ///< Classify SSH banners
    bool scanTelnet{true}; ///< Classify Telnet on port 23
    bool skipPing{false};  ///< Skip the reachability check before connecting

    bool operator==(const ScanFlags& other) const = default;
};

/**
 * @brief Unvalidated sweep configuration.
 */
struct ScanConfig {
    std::string startIp{"192.168.1.1"};   ///< First address of the range (dotted quad)
    std::string endIp{"192.168.1.255"};   ///< Last address of the range (dotted quad)
    std::string portSpec{"5037,5555,22,23"}; ///< "p", "a-b" or "p1,p2,a-b"; empty means service defaults
    int threads{50};                      ///< Worker count, clamped to 200
    double timeoutSeconds{1.0};           ///< Per-step timeout in seconds
    ScanFlags flags;                      ///< Services and options
    std::optional<std::string> profile;   ///< Profile name overriding threads/timeout
    std::optional<uint64_t> maxTargets;   ///< Optional cap on (ip, port) pairs

    bool operator==(const ScanConfig& other) const = default;
};

/**
 * @brief Configuration accepted by the validator.
 */
struct ValidatedConfig {
    uint32_t startAddress{0};        ///< First address, host byte order
    uint32_t endAddress{0};          ///< Last address, host byte order, >= startAddress
    std::vector<uint16_t> ports;     ///< Resolved ports in scan order, no duplicates
    int threads{1};                  ///< Worker count in [1,200]
    std::chrono::milliseconds timeout{1000}; ///< Per-step timeout in [100ms,10s]
    ScanFlags flags;                 ///< Services and options
    std::optional<ScanProfile> profile; ///< Profile that supplied threads/timeout
    bool threadsClamped{false};      ///< Whether the requested thread count was reduced

    /**
     * @brief Number of addresses in the range.
     */
    [[nodiscard]] uint64_t hostCount() const {
        return static_cast<uint64_t>(endAddress) - startAddress + 1;
    }

    /**
     * @brief Number of (ip, port) pairs in the sweep.
     */
    [[nodiscard]] uint64_t totalTargets() const { return hostCount() * ports.size(); }
};

} // namespace devsweep::core
