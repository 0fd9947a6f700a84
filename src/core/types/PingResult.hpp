/**
 * @file PingResult.hpp
 * @brief Result of a reachability check.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace devsweep::core {

/**
 * @brief How a reachability check was carried out.
 */
enum class PingMethod : int {
    RawSocket = 0,      ///< ICMP echo over SOCK_RAW (needs CAP_NET_RAW)
    DatagramSocket = 1, ///< ICMP echo over an unprivileged SOCK_DGRAM ping socket
    SystemPing = 2      ///< The system ping binary, spawned with an argument vector
};

/**
 * @brief Result of a single ICMP echo attempt.
 */
struct PingResult {
    std::string address;     ///< Address that was pinged
    std::chrono::system_clock::time_point timestamp; ///< When the ping was performed
    std::chrono::microseconds latency{0}; ///< Round-trip time in microseconds
    bool success{false};     ///< Whether an echo reply arrived before the timeout
    std::optional<int> ttl;  ///< Time-to-live from the reply (raw sockets only)
    PingMethod method{PingMethod::RawSocket}; ///< Mechanism that produced the result
    std::string errorMessage; ///< Error message if the ping failed

    /**
     * @brief Converts the latency to milliseconds.
     * @return Latency as a floating-point number of milliseconds.
     */
    [[nodiscard]] double latencyMs() const {
        return static_cast<double>(latency.count()) / 1000.0;
    }

    bool operator==(const PingResult& other) const = default;
};

} // namespace devsweep::core
