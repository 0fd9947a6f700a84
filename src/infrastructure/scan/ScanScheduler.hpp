#pragma once

#include "core/scan/CancellationToken.hpp"
#include "core/scan/ScanAggregator.hpp"
#include "core/scan/TargetGenerator.hpp"
#include "core/services/IProbeExecutor.hpp"
#include "core/types/ScanConfig.hpp"
#include "core/types/ScanProgress.hpp"
#include "infrastructure/scan/WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace devsweep::infra {

/**
 * @brief Bounded worker pool that drives one sweep.
 *
 * start() posts min(threads, targets) worker loops onto a private
 * WorkerPool with exactly that many threads. Every worker pulls the next
 * target from the shared generator, probes it and records the result, so
 * no more than `threads` probes are ever in flight.
 *
 * Cancellation is cooperative: workers check the token between targets and
 * never interrupt a running probe, so the sweep reaches Cancelled about one
 * probe duration after cancel() is requested.
 *
 * A probe that throws is recorded as ProbeFailed and the worker carries on.
 * A worker that dies outright, or whose thread could not be started, is
 * not replaced; the sweep only fails when every worker is gone with
 * targets left.
 */
class ScanScheduler {
public:
    /**
     * @brief Constructs an idle scheduler.
     * @param executor Probe implementation, shared by all workers.
     * @param aggregator Sink for every result.
     * @param token Cancellation flag checked between targets.
     * @param launcher Thread factory for the worker pool; defaults to std::thread.
     */
    ScanScheduler(core::IProbeExecutor& executor, core::ScanAggregator& aggregator,
                  core::CancellationToken& token, WorkerPool::ThreadLauncher launcher = {});

    /**
     * @brief Destructor. Cancels, waits for workers to drain and joins the pool.
     */
    ~ScanScheduler();

    ScanScheduler(const ScanScheduler&) = delete;
    ScanScheduler& operator=(const ScanScheduler&) = delete;

    /**
     * @brief Starts the sweep without blocking.
     * @param config Validated configuration.
     * @throws std::logic_error if the scheduler was already started.
     */
    void start(const core::ValidatedConfig& config);

    core::ScanState state() const { return state_.load(); }

    bool isDone() const { return core::isTerminal(state_.load()); }

    /**
     * @brief Blocks until the sweep reaches a terminal state or the timeout expires.
     * @return True if the sweep is done.
     */
    bool waitFor(std::chrono::milliseconds timeout);

    /**
     * @brief Blocks until the sweep reaches a terminal state.
     */
    void wait();

    /**
     * @brief Number of workers still running.
     */
    size_t liveWorkers() const;

private:
    void workerLoop(size_t workerIndex);
    core::ProbeResult runProbe(const core::Target& target);
    void onWorkerExit(size_t workerIndex, bool crashed);

    core::IProbeExecutor& executor_;
    core::ScanAggregator& aggregator_;
    core::CancellationToken& token_;
    WorkerPool::ThreadLauncher launcher_;

    core::ValidatedConfig config_;
    std::unique_ptr<core::TargetGenerator> generator_;
    std::unique_ptr<WorkerPool> pool_;

    std::atomic<core::ScanState> state_{core::ScanState::Idle};
    mutable std::mutex mutex_;
    std::condition_variable doneCondition_;
    size_t workerCount_{0};
    size_t liveWorkers_{0};
    size_t crashedWorkers_{0};
};

} // namespace devsweep::infra
