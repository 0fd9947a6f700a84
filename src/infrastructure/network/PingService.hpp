#pragma once

#include "core/services/IPingService.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace devsweep::infra {

/**
 * @brief ICMP echo reachability check with graceful privilege fallback.
 *
 * Tries, in order, a raw ICMP socket, an unprivileged ICMP datagram socket
 * and the system ping binary. The first mechanism that can be set up is
 * remembered for later calls. The binary is started with posix_spawnp and
 * an argument vector, never through a shell, and is killed if it outlives
 * the timeout.
 *
 * @note Raw sockets need CAP_NET_RAW; datagram ping sockets need the
 *       caller's group in net.ipv4.ping_group_range.
 */
class PingService : public core::IPingService {
public:
    PingService();
    ~PingService() override = default;

    PingService(const PingService&) = delete;
    PingService& operator=(const PingService&) = delete;

    /**
     * @brief Sends one echo request to an IPv4 address.
     * @param address Dotted-quad IPv4 address.
     * @param timeout Maximum time to wait for the reply.
     * @return The ping result with latency or error info.
     */
    core::PingResult ping(const std::string& address, std::chrono::milliseconds timeout) override;

    /**
     * @brief Returns the mechanism the next ping will start with.
     */
    core::PingMethod method() const { return method_.load(); }

    /**
     * @brief Computes the RFC 1071 internet checksum.
     */
    static uint16_t calculateChecksum(const uint8_t* data, size_t length);

    /**
     * @brief Builds a 64-byte ICMP echo request with a valid checksum.
     */
    static std::vector<uint8_t> buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence);

private:
    std::optional<core::PingResult> pingWithSocket(const std::string& address,
                                                   std::chrono::milliseconds timeout, bool raw);
    core::PingResult pingWithSystemBinary(const std::string& address,
                                          std::chrono::milliseconds timeout);

    std::atomic<core::PingMethod> method_{core::PingMethod::RawSocket};
    std::atomic<uint16_t> sequenceNumber_{0};
    uint16_t identifier_;
};

} // namespace devsweep::infra
