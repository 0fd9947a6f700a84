/**
 * @file TargetGenerator.hpp
 * @brief Lazy (ip, port) cross-product shared by all workers.
 */

#pragma once

#include "core/types/ScanConfig.hpp"
#include "core/types/Target.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace devsweep::core {

/**
 * @brief Streams every (ip, port) pair of a sweep exactly once.
 *
 * Order is IP-major: addresses ascending in the outer loop, ports in the
 * order supplied in the inner loop. Only a cursor is kept, so a /16 with
 * five ports costs the same memory as a single host. The sequence cannot
 * be rewound; construct a new generator to restart.
 *
 * next() may be called concurrently from any number of threads.
 */
class TargetGenerator {
public:
    /**
     * @brief Constructs a generator over [startAddress, endAddress] x ports.
     * @param startAddress First address, host byte order.
     * @param endAddress Last address, host byte order. Must be >= startAddress.
     * @param ports Ports in scan order.
     */
    TargetGenerator(uint32_t startAddress, uint32_t endAddress, std::vector<uint16_t> ports);

    explicit TargetGenerator(const ValidatedConfig& config);

    TargetGenerator(const TargetGenerator&) = delete;
    TargetGenerator& operator=(const TargetGenerator&) = delete;

    /**
     * @brief Returns the next target, or nullopt once all were handed out.
     */
    std::optional<Target> next();

    /**
     * @brief Total number of targets, (end - start + 1) x |ports|.
     */
    [[nodiscard]] uint64_t size() const { return total_; }

    /**
     * @brief Number of targets handed out so far.
     */
    [[nodiscard]] uint64_t dispatched() const;

    /**
     * @brief Checks whether every target has been handed out.
     */
    [[nodiscard]] bool exhausted() const { return dispatched() >= total_; }

    /**
     * @brief Returns the target at a position without advancing.
     * @param index Position in [0, size()).
     */
    [[nodiscard]] Target at(uint64_t index) const;

private:
    uint32_t startAddress_;
    std::vector<uint16_t> ports_;
    uint64_t total_;
    std::atomic<uint64_t> cursor_{0};
};

} // namespace devsweep::core
