/**
 * @file IPingService.hpp
 * @brief Interface for the reachability check run before connecting.
 */

#pragma once

#include "core/types/PingResult.hpp"

#include <chrono>
#include <string>

namespace devsweep::core {

/**
 * @brief Interface for ICMP reachability checks.
 *
 * Implementations must return within the given timeout (plus a small
 * grace period for process cleanup) and must never hand the address to a
 * command interpreter.
 */
class IPingService {
public:
    virtual ~IPingService() = default;

    /**
     * @brief Sends one echo request and waits for the reply.
     * @param address Dotted-quad IPv4 address.
     * @param timeout Maximum time to wait for a reply.
     * @return The ping result; failures are reported in the result, not thrown.
     */
    virtual PingResult ping(const std::string& address, std::chrono::milliseconds timeout) = 0;
};

} // namespace devsweep::core
