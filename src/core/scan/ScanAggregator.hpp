/**
 * @file ScanAggregator.hpp
 * @brief Thread-safe collection point for probe results and progress.
 */

#pragma once

#include "core/types/ProbeResult.hpp"
#include "core/types/ScanProgress.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace devsweep::core {

/**
 * @brief Accumulates results from all workers of one sweep.
 *
 * Results and counters are guarded separately: a record() holds the
 * counter lock only for the increment, so snapshot() never waits behind
 * a result append. Recorded results are never modified.
 */
class ScanAggregator {
public:
    /**
     * @brief Callback invoked for every recorded result, outside any lock.
     */
    using ResultCallback = std::function<void(const ProbeResult&)>;

    /**
     * @brief Callback invoked with the progress after a record.
     *
     * Deliveries are serialized and never report fewer scanned targets than
     * the previous one. A snapshot overtaken by a later count is dropped, so
     * the callback may see fewer calls than records, but always sees the
     * final count.
     */
    using ProgressCallback = std::function<void(const ScanProgress&)>;

    /**
     * @brief Constructs an aggregator for a sweep.
     * @param totalTargets Number of targets the sweep will record.
     * @param portOrder Ports in scan order, used to order results within one address.
     */
    explicit ScanAggregator(uint64_t totalTargets, std::vector<uint16_t> portOrder = {});

    ScanAggregator(const ScanAggregator&) = delete;
    ScanAggregator& operator=(const ScanAggregator&) = delete;

    /**
     * @brief Sets the per-result subscriber. Call before the sweep starts.
     */
    void setResultCallback(ResultCallback callback) { resultCallback_ = std::move(callback); }

    /**
     * @brief Sets the progress subscriber. Call before the sweep starts.
     */
    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }

    /**
     * @brief Starts the elapsed-time clock.
     */
    void markStarted();

    /**
     * @brief Freezes the elapsed-time clock at the end of the sweep.
     */
    void markFinished();

    /**
     * @brief Stores a result, advances the counters, then notifies subscribers.
     *
     * The result is stored before any subscriber runs, so an exception
     * thrown by a subscriber propagates without losing it.
     */
    void record(const ProbeResult& result);

    /**
     * @brief Returns a consistent point-in-time view of the counters.
     */
    [[nodiscard]] ScanProgress snapshot() const;

    /**
     * @brief Returns every recorded result, ordered by address then scan port order.
     */
    [[nodiscard]] std::vector<ProbeResult> results() const;

    /**
     * @brief Returns recorded results with an open port, in the same order.
     */
    [[nodiscard]] std::vector<ProbeResult> openResults() const;

    /**
     * @brief Number of results recorded so far.
     */
    [[nodiscard]] size_t resultCount() const;

private:
    void sortByScanOrder(std::vector<ProbeResult>& results) const;
    std::chrono::milliseconds elapsedLocked() const;

    const uint64_t totalTargets_;
    std::unordered_map<uint16_t, size_t> portRank_;

    ResultCallback resultCallback_;
    ProgressCallback progressCallback_;

    mutable std::mutex resultsMutex_;
    std::vector<ProbeResult> results_;

    mutable std::mutex countersMutex_;
    uint64_t scanned_{0};
    uint64_t open_{0};
    std::optional<std::chrono::steady_clock::time_point> startTime_;
    std::optional<std::chrono::milliseconds> finalElapsed_;

    std::mutex deliveryMutex_;
    uint64_t lastDelivered_{0};
};

} // namespace devsweep::core
