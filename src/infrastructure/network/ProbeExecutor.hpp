#pragma once

#include "core/services/IPingService.hpp"
#include "core/services/IProbeExecutor.hpp"

#include <cstdint>
#include <future>
#include <map>
#include <mutex>

namespace devsweep::infra {

/**
 * @brief TCP connect probe with a minimal service handshake.
 *
 * Each probe runs on its own short-lived asio::io_context owned by the
 * calling worker thread: an async connect raced against a steady_timer,
 * then an optional request write and a reply read raced against a second
 * deadline. When a deadline wins, the socket is closed, which aborts the
 * pending operation, so no socket outlives its probe.
 *
 * Reachability is checked once per address and shared by all ports of that
 * address; the cache only keeps a window of recent addresses.
 * Implements core::IProbeExecutor.
 */
class ProbeExecutor : public core::IProbeExecutor {
public:
    /**
     * @brief Constructs a ProbeExecutor.
     * @param pingService Reachability checker, used unless skipPing is set.
     */
    explicit ProbeExecutor(core::IPingService& pingService);

    ~ProbeExecutor() override = default;

    /**
     * @brief Probes one target.
     * @param target The (address, port) pair.
     * @param timeout Bound for the ping, the connect and the handshake, each.
     * @param flags Enabled services and the skip-ping option.
     * @return The probe result. Never throws for network failures.
     */
    core::ProbeResult probe(const core::Target& target, std::chrono::milliseconds timeout,
                            const core::ScanFlags& flags) override;

private:
    bool checkReachable(const core::Target& target, std::chrono::milliseconds timeout);

    core::IPingService& pingService_;
    std::mutex cacheMutex_;
    std::map<uint32_t, std::shared_future<bool>> reachability_;
};

} // namespace devsweep::infra
