#pragma once

#include <asio.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace devsweep::test {

/**
 * @brief TCP listener on 127.0.0.1 that plays a scripted service.
 *
 * Each connection first reads `expectBytes` bytes (if any), then writes
 * `reply` (if any) and keeps the socket open until the server is destroyed.
 * Throws asio::system_error if the port cannot be bound.
 */
class LoopbackServer {
public:
    LoopbackServer(std::vector<uint8_t> reply, size_t expectBytes = 0, uint16_t port = 0)
        : reply_(std::move(reply)), expectBytes_(expectBytes), acceptor_(io_) {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        accept();
        thread_ = std::thread([this]() { io_.run(); });
    }

    ~LoopbackServer() {
        io_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    /**
     * @brief Bytes received on the most recent connection that sent any.
     */
    std::vector<uint8_t> received() const {
        std::lock_guard lock(mutex_);
        return received_;
    }

    size_t connectionCount() const {
        std::lock_guard lock(mutex_);
        return connectionCount_;
    }

private:
    void accept() {
        acceptor_.async_accept([this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec) {
                return;
            }
            auto conn = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
            connections_.push_back(conn);
            {
                std::lock_guard lock(mutex_);
                ++connectionCount_;
            }
            serve(conn);
            accept();
        });
    }

    void serve(const std::shared_ptr<asio::ip::tcp::socket>& conn) {
        if (expectBytes_ == 0) {
            send(conn);
            return;
        }

        auto buffer = std::make_shared<std::vector<uint8_t>>(expectBytes_);
        asio::async_read(*conn, asio::buffer(*buffer),
                         [this, conn, buffer](const asio::error_code& ec, std::size_t n) {
                             if (ec) {
                                 return;
                             }
                             {
                                 std::lock_guard lock(mutex_);
                                 received_.assign(buffer->begin(), buffer->begin() + n);
                             }
                             send(conn);
                         });
    }

    void send(const std::shared_ptr<asio::ip::tcp::socket>& conn) {
        if (reply_.empty()) {
            return;
        }
        asio::async_write(*conn, asio::buffer(reply_),
                          [conn](const asio::error_code&, std::size_t) {});
    }

    std::vector<uint8_t> reply_;
    size_t expectBytes_;

    asio::io_context io_;
    asio::ip::tcp::acceptor acceptor_;
    std::vector<std::shared_ptr<asio::ip::tcp::socket>> connections_;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::vector<uint8_t> received_;
    size_t connectionCount_{0};
};

/**
 * @brief Distinct loopback ports with nothing listening on them.
 */
inline std::vector<uint16_t> closedLoopbackPorts(size_t count) {
    asio::io_context io;
    std::vector<std::unique_ptr<asio::ip::tcp::acceptor>> held;
    std::vector<uint16_t> ports;

    // Hold every port until all are chosen so none repeats
    for (size_t i = 0; i < count; ++i) {
        held.push_back(std::make_unique<asio::ip::tcp::acceptor>(
            io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)));
        ports.push_back(held.back()->local_endpoint().port());
    }
    return ports;
}

inline uint16_t closedLoopbackPort() {
    return closedLoopbackPorts(1).front();
}

inline std::vector<uint8_t> bytes(const std::string& str) {
    return {str.begin(), str.end()};
}

} // namespace devsweep::test
