#include <catch2/catch_test_macros.hpp>

#include "core/scan/CancellationToken.hpp"
#include "core/scan/ScanAggregator.hpp"
#include "core/services/IProbeExecutor.hpp"
#include "infrastructure/scan/ScanScheduler.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <system_error>
#include <thread>

using namespace devsweep::core;
using namespace devsweep::infra;

namespace {

constexpr uint32_t BASE = 0x0A000001u; // 10.0.0.1

/**
 * Records how many probes run at once and which targets were probed.
 */
class InstrumentedExecutor : public IProbeExecutor {
public:
    explicit InstrumentedExecutor(std::chrono::milliseconds delay) : delay_(delay) {}

    ProbeResult probe(const Target& target, std::chrono::milliseconds timeout,
                      const ScanFlags& flags) override {
        auto now = inFlight_.fetch_add(1) + 1;
        auto peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
        if (cancelled_.load()) {
            startedAfterCancel_.fetch_add(1);
        }

        {
            std::lock_guard lock(mutex_);
            probed_.emplace(target.address, target.port);
            lastTimeout_ = timeout;
            lastFlags_ = flags;
        }

        std::this_thread::sleep_for(delay_);
        inFlight_.fetch_sub(1);

        if (failPort_ && target.port == *failPort_) {
            throw std::runtime_error("simulated probe fault");
        }

        ProbeResult result;
        result.target = target;
        result.open = target.port == 22;
        result.deviceType = result.open ? DeviceType::SSH : DeviceType::Unknown;
        result.timestamp = std::chrono::system_clock::now();
        return result;
    }

    void failOnPort(uint16_t port) { failPort_ = port; }
    void noteCancelled() { cancelled_.store(true); }

    int peak() const { return peak_.load(); }
    int inFlight() const { return inFlight_.load(); }
    int startedAfterCancel() const { return startedAfterCancel_.load(); }

    size_t probedCount() const {
        std::lock_guard lock(mutex_);
        return probed_.size();
    }

    std::chrono::milliseconds lastTimeout() const {
        std::lock_guard lock(mutex_);
        return lastTimeout_;
    }

    ScanFlags lastFlags() const {
        std::lock_guard lock(mutex_);
        return lastFlags_;
    }

private:
    std::chrono::milliseconds delay_;
    std::optional<uint16_t> failPort_;
    std::atomic<int> inFlight_{0};
    std::atomic<int> peak_{0};
    std::atomic<bool> cancelled_{false};
    std::atomic<int> startedAfterCancel_{0};
    mutable std::mutex mutex_;
    std::set<std::pair<uint32_t, uint16_t>> probed_;
    std::chrono::milliseconds lastTimeout_{0};
    ScanFlags lastFlags_;
};

ValidatedConfig makeConfig(uint32_t hosts, std::vector<uint16_t> ports, int threads) {
    ValidatedConfig config;
    config.startAddress = BASE;
    config.endAddress = BASE + hosts - 1;
    config.ports = std::move(ports);
    config.threads = threads;
    config.timeout = std::chrono::milliseconds(250);
    return config;
}

/**
 * Launches real threads until the limit, then fails like the OS does with EAGAIN.
 */
WorkerPool::ThreadLauncher limitedLauncher(size_t limit, std::shared_ptr<std::atomic<size_t>> launched) {
    return [limit, launched](std::function<void()> body) {
        if (launched->load() >= limit) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread limit reached");
        }
        launched->fetch_add(1);
        return std::thread(std::move(body));
    };
}

} // namespace

TEST_CASE("ScanScheduler runs every target once", "[ScanScheduler]") {
    auto config = makeConfig(10, {22, 23}, 4);
    InstrumentedExecutor executor(std::chrono::milliseconds(2));
    ScanAggregator aggregator(config.totalTargets(), config.ports);
    CancellationToken token;
    ScanScheduler scheduler(executor, aggregator, token);

    scheduler.start(config);
    REQUIRE(scheduler.waitFor(std::chrono::seconds(10)));

    REQUIRE(scheduler.state() == ScanState::Completed);
    REQUIRE(scheduler.isDone());
    REQUIRE(scheduler.liveWorkers() == 0);

    auto progress = aggregator.snapshot();
    REQUIRE(progress.scannedTargets == 20);
    REQUIRE(progress.openTargets == 10);
    REQUIRE(executor.probedCount() == 20);
    REQUIRE(aggregator.resultCount() == 20);

    SECTION("Results come back in scan order") {
        auto results = aggregator.results();
        REQUIRE(results.front().target == Target{BASE, 22});
        REQUIRE(results[1].target == Target{BASE, 23});
        REQUIRE(results.back().target == Target{BASE + 9, 23});
    }

    SECTION("Executor receives the configured timeout and flags") {
        REQUIRE(executor.lastTimeout() == std::chrono::milliseconds(250));
        REQUIRE(executor.lastFlags() == config.flags);
    }
}

TEST_CASE("ScanScheduler concurrency cap", "[ScanScheduler]") {
    SECTION("Never more probes in flight than threads") {
        auto config = makeConfig(40, {22, 23}, 5);
        InstrumentedExecutor executor(std::chrono::milliseconds(5));
        ScanAggregator aggregator(config.totalTargets());
        CancellationToken token;
        ScanScheduler scheduler(executor, aggregator, token);

        scheduler.start(config);
        REQUIRE(scheduler.waitFor(std::chrono::seconds(10)));

        REQUIRE(executor.peak() >= 1);
        REQUIRE(executor.peak() <= 5);
        REQUIRE(executor.inFlight() == 0);
    }

    SECTION("Fewer targets than threads") {
        auto config = makeConfig(3, {22}, 50);
        InstrumentedExecutor executor(std::chrono::milliseconds(5));
        ScanAggregator aggregator(config.totalTargets());
        CancellationToken token;
        ScanScheduler scheduler(executor, aggregator, token);

        scheduler.start(config);
        REQUIRE(scheduler.waitFor(std::chrono::seconds(10)));

        REQUIRE(executor.peak() <= 3);
        REQUIRE(aggregator.snapshot().scannedTargets == 3);
    }
}

TEST_CASE("ScanScheduler cancellation", "[ScanScheduler]") {
    auto config = makeConfig(500, {22, 23}, 2);
    InstrumentedExecutor executor(std::chrono::milliseconds(10));
    ScanAggregator aggregator(config.totalTargets());
    CancellationToken token;
    ScanScheduler scheduler(executor, aggregator, token);

    scheduler.start(config);

    while (aggregator.snapshot().scannedTargets < 4) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    executor.noteCancelled();
    token.cancel();

    // Drains within roughly one probe duration
    REQUIRE(scheduler.waitFor(std::chrono::seconds(2)));
    REQUIRE(scheduler.state() == ScanState::Cancelled);

    auto progress = aggregator.snapshot();
    REQUIRE(progress.scannedTargets < progress.totalTargets);
    REQUIRE(progress.scannedTargets == aggregator.resultCount());

    // Workers may already have pulled a target when the flag flipped
    REQUIRE(executor.startedAfterCancel() <= config.threads);
    REQUIRE(executor.inFlight() == 0);

    SECTION("Cancelling again changes nothing") {
        token.cancel();
        REQUIRE(scheduler.state() == ScanState::Cancelled);
        REQUIRE(aggregator.snapshot().scannedTargets == progress.scannedTargets);
    }
}

TEST_CASE("ScanScheduler isolates probe faults", "[ScanScheduler]") {
    auto config = makeConfig(5, {22, 23, 5555}, 3);
    InstrumentedExecutor executor(std::chrono::milliseconds(1));
    executor.failOnPort(23);
    ScanAggregator aggregator(config.totalTargets(), config.ports);
    CancellationToken token;
    ScanScheduler scheduler(executor, aggregator, token);

    scheduler.start(config);
    REQUIRE(scheduler.waitFor(std::chrono::seconds(10)));

    REQUIRE(scheduler.state() == ScanState::Completed);
    REQUIRE(aggregator.snapshot().scannedTargets == 15);

    int failed = 0;
    for (const auto& result : aggregator.results()) {
        if (result.target.port == 23) {
            REQUIRE(result.error == ProbeError::ProbeFailed);
            REQUIRE_FALSE(result.open);
            ++failed;
        } else {
            REQUIRE_FALSE(result.error.has_value());
        }
    }
    REQUIRE(failed == 5);
}

TEST_CASE("ScanScheduler fails when every worker stops", "[ScanScheduler]") {
    auto config = makeConfig(20, {22}, 3);
    InstrumentedExecutor executor(std::chrono::milliseconds(1));
    ScanAggregator aggregator(config.totalTargets());
    aggregator.setResultCallback(
        [](const ProbeResult&) { throw std::runtime_error("subscriber failure"); });
    CancellationToken token;
    ScanScheduler scheduler(executor, aggregator, token);

    scheduler.start(config);
    REQUIRE(scheduler.waitFor(std::chrono::seconds(10)));

    REQUIRE(scheduler.state() == ScanState::Failed);
    // One result per worker before it stopped
    REQUIRE(aggregator.snapshot().scannedTargets == 3);
    REQUIRE(scheduler.liveWorkers() == 0);
}

TEST_CASE("ScanScheduler lifecycle", "[ScanScheduler]") {
    auto config = makeConfig(2, {22}, 1);
    InstrumentedExecutor executor(std::chrono::milliseconds(1));
    ScanAggregator aggregator(config.totalTargets());
    CancellationToken token;
    ScanScheduler scheduler(executor, aggregator, token);

    SECTION("Idle before start") {
        REQUIRE(scheduler.state() == ScanState::Idle);
        REQUIRE_FALSE(scheduler.isDone());
        REQUIRE_FALSE(scheduler.waitFor(std::chrono::milliseconds(10)));
    }

    SECTION("Starting twice is a logic error") {
        scheduler.start(config);
        REQUIRE_THROWS_AS(scheduler.start(config), std::logic_error);
        scheduler.wait();
        REQUIRE(scheduler.state() == ScanState::Completed);
    }

    SECTION("Elapsed time is frozen once done") {
        scheduler.start(config);
        scheduler.wait();
        auto elapsed = aggregator.snapshot().elapsed;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE(aggregator.snapshot().elapsed == elapsed);
    }
}

TEST_CASE("ScanScheduler destructor drains a running sweep", "[ScanScheduler]") {
    auto config = makeConfig(1000, {22}, 4);
    InstrumentedExecutor executor(std::chrono::milliseconds(5));
    ScanAggregator aggregator(config.totalTargets());
    CancellationToken token;

    {
        ScanScheduler scheduler(executor, aggregator, token);
        scheduler.start(config);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    REQUIRE(token.isCancelled());
    REQUIRE(executor.inFlight() == 0);
    REQUIRE(aggregator.snapshot().scannedTargets < 1000);
}

TEST_CASE("ScanScheduler survives thread start failures", "[ScanScheduler]") {
    auto config = makeConfig(20, {22, 23}, 4);
    InstrumentedExecutor executor(std::chrono::milliseconds(1));
    ScanAggregator aggregator(config.totalTargets());
    CancellationToken token;
    auto launched = std::make_shared<std::atomic<size_t>>(0);

    SECTION("Fewer threads than requested still finish the sweep") {
        ScanScheduler scheduler(executor, aggregator, token, limitedLauncher(2, launched));
        scheduler.start(config);

        REQUIRE(scheduler.waitFor(std::chrono::seconds(10)));
        REQUIRE(scheduler.state() == ScanState::Completed);
        REQUIRE(launched->load() == 2);
        REQUIRE(executor.peak() <= 2);
        REQUIRE(executor.probedCount() == 40);
        REQUIRE(aggregator.snapshot().scannedTargets == 40);
    }

    SECTION("No thread at all fails the sweep instead of hanging") {
        ScanScheduler scheduler(executor, aggregator, token, limitedLauncher(0, launched));
        scheduler.start(config);

        REQUIRE(scheduler.waitFor(std::chrono::seconds(1)));
        REQUIRE(scheduler.state() == ScanState::Failed);
        REQUIRE(scheduler.liveWorkers() == 0);
        REQUIRE(executor.probedCount() == 0);
    }
}
