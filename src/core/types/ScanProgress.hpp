/**
 * @file ScanProgress.hpp
 * @brief Progress counters and lifecycle state of a sweep.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace devsweep::core {

/**
 * @brief Lifecycle of a sweep.
 *
 * Idle -> Running -> {Completed, Cancelled, Failed}. The three terminal
 * states are final for a session.
 */
enum class ScanState : int {
    Idle = 0,      ///< Not started yet
    Running = 1,   ///< Workers are pulling targets
    Completed = 2, ///< Every target was probed and reported
    Cancelled = 3, ///< Cancellation requested and in-flight probes drained
    Failed = 4     ///< Every worker crashed before the targets ran out
};

/**
 * @brief Converts a ScanState to a string (e.g., "Running").
 */
std::string scanStateToString(ScanState state);

/**
 * @brief Returns true for Completed, Cancelled and Failed.
 */
[[nodiscard]] inline bool isTerminal(ScanState state) {
    return state == ScanState::Completed || state == ScanState::Cancelled ||
           state == ScanState::Failed;
}

/**
 * @brief Point-in-time progress of a sweep.
 *
 * All counters are monotonically non-decreasing over one sweep.
 */
struct ScanProgress {
    uint64_t totalTargets{0};  ///< Number of (ip, port) pairs in the sweep
    uint64_t scannedTargets{0}; ///< Targets with a recorded result
    uint64_t openTargets{0};   ///< Targets with an open port
    std::chrono::milliseconds elapsed{0}; ///< Time since the sweep started

    /**
     * @brief Calculates the completion percentage.
     * @return Percentage of targets scanned (0-100).
     */
    [[nodiscard]] double percentComplete() const {
        return totalTargets > 0
                   ? (static_cast<double>(scannedTargets) / static_cast<double>(totalTargets)) * 100.0
                   : 0.0;
    }

    bool operator==(const ScanProgress& other) const = default;
};

} // namespace devsweep::core
