/**
 * @file IProbeExecutor.hpp
 * @brief Interface for probing one (ip, port) target.
 */

#pragma once

#include "core/types/ProbeResult.hpp"
#include "core/types/ScanConfig.hpp"
#include "core/types/Target.hpp"

#include <chrono>

namespace devsweep::core {

/**
 * @brief Probes a single target: optional ping, TCP connect, handshake.
 *
 * Each step is bounded by the timeout, so a probe returns after at most
 * three timeout intervals. Implementations are called concurrently from
 * every worker of a sweep and must be thread-safe.
 */
class IProbeExecutor {
public:
    virtual ~IProbeExecutor() = default;

    /**
     * @brief Probes one target.
     * @param target The (address, port) pair.
     * @param timeout Bound applied to each step independently.
     * @param flags Enabled services and the skip-ping option.
     * @return The result; per-target failures are reported in it, not thrown.
     */
    virtual ProbeResult probe(const Target& target, std::chrono::milliseconds timeout,
                              const ScanFlags& flags) = 0;
};

} // namespace devsweep::core
