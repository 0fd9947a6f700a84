#include "infrastructure/network/ProbeExecutor.hpp"

#include "core/protocol/ServiceHandshake.hpp"

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <vector>

namespace devsweep::infra {

namespace {

// Addresses further than this below the newest cached one are evicted.
constexpr uint64_t REACHABILITY_CACHE_WINDOW = 512;
constexpr size_t REPLY_BUFFER_SIZE = 256;

struct IoOutcome {
    asio::error_code error;
    size_t bytes{0};
    bool timedOut{false};
};

// Runs one async operation to completion, closing the socket if the deadline
// passes first. The operation's handler then completes with operation_aborted.
template <typename Initiate>
IoOutcome runWithDeadline(asio::io_context& io, asio::ip::tcp::socket& socket,
                          std::chrono::steady_clock::time_point deadline, Initiate&& initiate) {
    IoOutcome outcome;
    bool completed = false;

    asio::steady_timer timer(io);
    timer.expires_at(deadline);
    timer.async_wait([&](const asio::error_code& ec) {
        if (ec || completed) {
            return;
        }
        outcome.timedOut = true;
        asio::error_code ignored;
        socket.close(ignored);
    });

    initiate([&](const asio::error_code& ec, std::size_t bytes) {
        completed = true;
        outcome.error = ec;
        outcome.bytes = bytes;
        timer.cancel();
    });

    io.restart();
    io.run();

    if (outcome.timedOut) {
        outcome.error = asio::error::timed_out;
    }
    return outcome;
}

core::ProbeError connectError(const IoOutcome& outcome) {
    const auto& ec = outcome.error;
    if (outcome.timedOut || ec == asio::error::timed_out) {
        return core::ProbeError::ConnectionTimeout;
    }
    if (ec == asio::error::host_unreachable || ec == asio::error::network_unreachable) {
        return core::ProbeError::UnreachableHost;
    }
    return core::ProbeError::ConnectionRefused;
}

} // namespace

ProbeExecutor::ProbeExecutor(core::IPingService& pingService) : pingService_(pingService) {}

core::ProbeResult ProbeExecutor::probe(const core::Target& target,
                                       std::chrono::milliseconds timeout,
                                       const core::ScanFlags& flags) {
    const auto startTime = std::chrono::steady_clock::now();

    core::ProbeResult result;
    result.target = target;

    auto finish = [&]() {
        result.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - startTime);
        result.timestamp = std::chrono::system_clock::now();
        return result;
    };

    try {
        if (!flags.skipPing) {
            bool reachable = checkReachable(target, timeout);
            result.reachable = reachable;
            if (!reachable) {
                result.deviceType = core::DeviceType::Unreachable;
                result.error = core::ProbeError::UnreachableHost;
                return finish();
            }
        }

        asio::io_context io;
        asio::ip::tcp::socket socket(io);
        asio::ip::tcp::endpoint endpoint(
            asio::ip::address_v4(static_cast<asio::ip::address_v4::uint_type>(target.address)),
            target.port);

        auto connected = runWithDeadline(
            io, socket, std::chrono::steady_clock::now() + timeout, [&](auto complete) {
                socket.async_connect(endpoint, [complete](const asio::error_code& ec) {
                    complete(ec, 0);
                });
            });

        if (connected.error) {
            result.error = connectError(connected);
            if (*result.error == core::ProbeError::UnreachableHost) {
                result.deviceType = core::DeviceType::Unreachable;
            }
            spdlog::trace("{} closed: {}", target.toString(), connected.error.message());
            return finish();
        }

        result.open = true;

        // The write and the read share one deadline
        const auto kind = core::ServiceHandshake::handshakeFor(target.port, flags);
        const auto handshakeDeadline = std::chrono::steady_clock::now() + timeout;
        const auto request = core::ServiceHandshake::requestFor(kind);
        std::vector<uint8_t> reply(REPLY_BUFFER_SIZE);
        bool handshakeTimedOut = false;

        bool sent = true;
        if (!request.empty()) {
            auto written = runWithDeadline(io, socket, handshakeDeadline, [&](auto complete) {
                asio::async_write(socket, asio::buffer(request),
                                  [complete](const asio::error_code& ec, std::size_t n) {
                                      complete(ec, n);
                                  });
            });
            sent = !written.error;
            handshakeTimedOut = written.timedOut;
        }

        if (sent) {
            auto received = runWithDeadline(io, socket, handshakeDeadline, [&](auto complete) {
                asio::async_read(socket, asio::buffer(reply),
                                 asio::transfer_at_least(
                                     core::ServiceHandshake::expectedReplySize(kind)),
                                 [complete](const asio::error_code& ec, std::size_t n) {
                                     complete(ec, n);
                                 });
            });
            reply.resize(received.bytes);
            handshakeTimedOut = received.timedOut && received.bytes == 0;
        } else {
            reply.clear();
        }

        result.deviceType = core::ServiceHandshake::classify(target.port, flags, reply);
        if (!reply.empty()) {
            result.banner = core::ServiceHandshake::sanitizeBanner(reply);
        } else if (handshakeTimedOut) {
            result.error = core::ProbeError::HandshakeTimeout;
        }

        asio::error_code ignored;
        socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket.close(ignored);

        spdlog::debug("{} open ({})", target.toString(), result.deviceTypeToString());
    } catch (const std::exception& e) {
        spdlog::debug("Probe of {} failed: {}", target.toString(), e.what());
        result.error = core::ProbeError::ProbeFailed;
    }

    return finish();
}

bool ProbeExecutor::checkReachable(const core::Target& target, std::chrono::milliseconds timeout) {
    std::shared_future<bool> pending;
    std::promise<bool> promise;
    bool owner = false;

    {
        std::lock_guard lock(cacheMutex_);
        auto it = reachability_.find(target.address);
        if (it != reachability_.end()) {
            pending = it->second;
        } else {
            pending = promise.get_future().share();
            reachability_.emplace(target.address, pending);
            owner = true;

            while (!reachability_.empty() &&
                   static_cast<uint64_t>(reachability_.begin()->first) + REACHABILITY_CACHE_WINDOW <
                       target.address) {
                reachability_.erase(reachability_.begin());
            }
        }
    }

    if (owner) {
        bool reachable = false;
        try {
            auto pingResult = pingService_.ping(target.ip(), timeout);
            reachable = pingResult.success;
            if (!reachable) {
                spdlog::debug("{} unreachable: {}", target.ip(), pingResult.errorMessage);
            }
        } catch (const std::exception& e) {
            spdlog::debug("Ping of {} failed: {}", target.ip(), e.what());
        }
        promise.set_value(reachable);
    }

    return pending.get();
}

} // namespace devsweep::infra
