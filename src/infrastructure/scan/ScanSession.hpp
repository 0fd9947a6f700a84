#pragma once

#include "core/scan/CancellationToken.hpp"
#include "core/scan/ScanAggregator.hpp"
#include "core/services/IPingService.hpp"
#include "core/services/IProbeExecutor.hpp"
#include "core/types/ScanConfig.hpp"
#include "infrastructure/scan/ScanScheduler.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace devsweep::infra {

/**
 * @brief One sweep, from start to retrieved results.
 *
 * Owns the validated configuration, the aggregator, the cancellation
 * token and the worker pool. A session runs exactly one sweep and is
 * discarded afterwards; create a new one to scan again. Independent
 * sessions may run side by side.
 *
 * @note Do not destroy a session from inside one of its own callbacks:
 *       the destructor joins the worker threads that invoke them.
 */
class ScanSession {
public:
    using ResultCallback = core::ScanAggregator::ResultCallback;
    using ProgressCallback = core::ScanAggregator::ProgressCallback;

    /**
     * @brief Constructs a session that probes with the built-in TCP executor.
     * @param config Validated configuration.
     */
    explicit ScanSession(core::ValidatedConfig config);

    /**
     * @brief Constructs a session with a caller-supplied probe executor.
     * @param config Validated configuration.
     * @param executor Executor shared by all workers; must be thread-safe.
     */
    ScanSession(core::ValidatedConfig config, std::shared_ptr<core::IProbeExecutor> executor);

    /**
     * @brief Destructor. Cancels the sweep and waits for in-flight probes to drain.
     */
    ~ScanSession();

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    /**
     * @brief Begins dispatching targets and returns immediately.
     * @param onResult Called from worker threads for every result.
     * @param onProgress Called from worker threads after every result.
     * @throws std::logic_error if the session was already started.
     *
     * A callback that throws stops the worker that invoked it; the sweep
     * ends as Failed once every worker has stopped this way.
     */
    void start(ResultCallback onResult = {}, ProgressCallback onProgress = {});

    /**
     * @brief Requests cancellation. Idempotent.
     *
     * No new targets are dispatched; probes already running finish on their
     * own timeout, so isDone() turns true within about one probe duration.
     */
    void cancel();

    [[nodiscard]] core::ScanProgress progress() const { return aggregator_.snapshot(); }

    /**
     * @brief Results recorded so far, by address then scan port order.
     */
    [[nodiscard]] std::vector<core::ProbeResult> results() const { return aggregator_.results(); }

    /**
     * @brief Recorded results with an open port.
     */
    [[nodiscard]] std::vector<core::ProbeResult> openResults() const {
        return aggregator_.openResults();
    }

    [[nodiscard]] bool isDone() const { return scheduler_.isDone(); }

    [[nodiscard]] core::ScanState state() const { return scheduler_.state(); }

    [[nodiscard]] bool isCancelled() const { return token_.isCancelled(); }

    /**
     * @brief Blocks until the sweep is done or the timeout expires.
     * @return True if the sweep is done.
     */
    bool wait(std::chrono::milliseconds timeout) { return scheduler_.waitFor(timeout); }

    const core::ValidatedConfig& config() const { return config_; }

private:
    core::ValidatedConfig config_;
    std::unique_ptr<core::IPingService> pingService_;
    std::shared_ptr<core::IProbeExecutor> executor_;
    core::CancellationToken token_;
    core::ScanAggregator aggregator_;
    ScanScheduler scheduler_;
};

/**
 * @brief Creates and starts a session with the built-in TCP executor.
 * @param config Validated configuration.
 * @param onResult Called from worker threads for every result.
 * @param onProgress Called from worker threads after every result.
 * @return The running session.
 */
std::unique_ptr<ScanSession> startScan(const core::ValidatedConfig& config,
                                       ScanSession::ResultCallback onResult = {},
                                       ScanSession::ProgressCallback onProgress = {});

} // namespace devsweep::infra
