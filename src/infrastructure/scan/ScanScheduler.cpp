#include "infrastructure/scan/ScanScheduler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace devsweep::infra {

ScanScheduler::ScanScheduler(core::IProbeExecutor& executor, core::ScanAggregator& aggregator,
                             core::CancellationToken& token, WorkerPool::ThreadLauncher launcher)
    : executor_(executor), aggregator_(aggregator), token_(token), launcher_(std::move(launcher)) {}

ScanScheduler::~ScanScheduler() {
    if (state_.load() != core::ScanState::Idle) {
        token_.cancel();
        wait();
    }
    pool_.reset();
}

void ScanScheduler::start(const core::ValidatedConfig& config) {
    auto expected = core::ScanState::Idle;
    if (!state_.compare_exchange_strong(expected, core::ScanState::Running)) {
        throw std::logic_error("ScanScheduler can only be started once");
    }

    config_ = config;
    generator_ = std::make_unique<core::TargetGenerator>(config_);

    const auto total = generator_->size();
    workerCount_ = static_cast<size_t>(
        std::min<uint64_t>(static_cast<uint64_t>(std::max(config_.threads, 1)), total));

    aggregator_.markStarted();
    spdlog::info("Scanning {} - {}: {} IPs * {} ports = {} targets, {} workers, {}ms timeout",
                 core::Target::addressToString(config_.startAddress),
                 core::Target::addressToString(config_.endAddress), config_.hostCount(),
                 config_.ports.size(), total, workerCount_, config_.timeout.count());

    if (workerCount_ == 0) {
        std::lock_guard lock(mutex_);
        aggregator_.markFinished();
        state_ = core::ScanState::Completed;
        doneCondition_.notify_all();
        return;
    }

    {
        std::lock_guard lock(mutex_);
        liveWorkers_ = workerCount_;
    }

    pool_ = std::make_unique<WorkerPool>(workerCount_, launcher_);
    size_t started = 0;
    try {
        started = pool_->run([this](size_t workerIndex) { workerLoop(workerIndex); });
    } catch (const std::exception& e) {
        spdlog::error("Worker pool failed to start: {}", e.what());
    }

    // Workers that never got a thread count as crashed
    for (size_t i = started; i < workerCount_; ++i) {
        onWorkerExit(i, true);
    }
}

bool ScanScheduler::waitFor(std::chrono::milliseconds timeout) {
    if (state_.load() == core::ScanState::Idle) {
        return false;
    }
    std::unique_lock lock(mutex_);
    return doneCondition_.wait_for(lock, timeout, [this]() { return isDone(); });
}

void ScanScheduler::wait() {
    if (state_.load() == core::ScanState::Idle) {
        return;
    }
    std::unique_lock lock(mutex_);
    doneCondition_.wait(lock, [this]() { return isDone(); });
}

size_t ScanScheduler::liveWorkers() const {
    std::lock_guard lock(mutex_);
    return liveWorkers_;
}

void ScanScheduler::workerLoop(size_t workerIndex) {
    try {
        while (!token_.isCancelled()) {
            auto target = generator_->next();
            if (!target) {
                break;
            }
            aggregator_.record(runProbe(*target));
        }
    } catch (const std::exception& e) {
        spdlog::error("Worker {} stopped after an unexpected error: {}", workerIndex, e.what());
        onWorkerExit(workerIndex, true);
        return;
    }

    onWorkerExit(workerIndex, false);
}

core::ProbeResult ScanScheduler::runProbe(const core::Target& target) {
    try {
        return executor_.probe(target, config_.timeout, config_.flags);
    } catch (const std::exception& e) {
        spdlog::warn("Probe of {} failed: {}", target.toString(), e.what());

        core::ProbeResult result;
        result.target = target;
        result.error = core::ProbeError::ProbeFailed;
        result.timestamp = std::chrono::system_clock::now();
        return result;
    }
}

void ScanScheduler::onWorkerExit(size_t workerIndex, bool crashed) {
    std::lock_guard lock(mutex_);

    if (crashed) {
        ++crashedWorkers_;
    }
    spdlog::trace("Worker {} exited ({} still running)", workerIndex, liveWorkers_ - 1);

    if (--liveWorkers_ > 0) {
        return;
    }

    core::ScanState finalState = core::ScanState::Completed;
    if (crashedWorkers_ == workerCount_ && !generator_->exhausted()) {
        finalState = core::ScanState::Failed;
    } else if (token_.isCancelled() && !generator_->exhausted()) {
        finalState = core::ScanState::Cancelled;
    }

    aggregator_.markFinished();
    auto progress = aggregator_.snapshot();

    if (finalState == core::ScanState::Failed) {
        spdlog::error("Scan failed: all {} workers stopped with {} of {} targets scanned",
                      workerCount_, progress.scannedTargets, progress.totalTargets);
    } else {
        spdlog::info("Scan {}: {} of {} targets scanned, {} open, {:.1f}s",
                     finalState == core::ScanState::Completed ? "complete" : "cancelled",
                     progress.scannedTargets, progress.totalTargets, progress.openTargets,
                     static_cast<double>(progress.elapsed.count()) / 1000.0);
    }

    state_ = finalState;
    doneCondition_.notify_all();
}

} // namespace devsweep::infra
