#include "infrastructure/network/PingService.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <random>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace devsweep::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;
constexpr size_t ICMP_HEADER_SIZE = 8;
constexpr auto SYSTEM_PING_GRACE = std::chrono::milliseconds(500);
constexpr auto SYSTEM_PING_POLL = std::chrono::milliseconds(10);

class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

} // namespace

PingService::PingService() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("PingService initialized with identifier: {}", identifier_);
}

uint16_t PingService::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> PingService::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[ICMP_HEADER_SIZE], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

core::PingResult PingService::ping(const std::string& address, std::chrono::milliseconds timeout) {
    auto method = method_.load();

    if (method == core::PingMethod::RawSocket) {
        if (auto result = pingWithSocket(address, timeout, true)) {
            return *result;
        }
        spdlog::info("Raw ICMP sockets not permitted, trying unprivileged ping sockets");
        method_ = method = core::PingMethod::DatagramSocket;
    }

    if (method == core::PingMethod::DatagramSocket) {
        if (auto result = pingWithSocket(address, timeout, false)) {
            return *result;
        }
        spdlog::info("ICMP ping sockets not permitted, falling back to the system ping binary");
        method_ = core::PingMethod::SystemPing;
    }

    return pingWithSystemBinary(address, timeout);
}

std::optional<core::PingResult> PingService::pingWithSocket(const std::string& address,
                                                            std::chrono::milliseconds timeout,
                                                            bool raw) {
    SocketHandle sock(socket(AF_INET, raw ? SOCK_RAW : SOCK_DGRAM, IPPROTO_ICMP));
    if (sock.get() < 0) {
        return std::nullopt;
    }

    core::PingResult result;
    result.address = address;
    result.timestamp = std::chrono::system_clock::now();
    result.method = raw ? core::PingMethod::RawSocket : core::PingMethod::DatagramSocket;

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    if (inet_pton(AF_INET, address.c_str(), &dest.sin_addr) != 1) {
        result.errorMessage = "Invalid address";
        return result;
    }

    uint16_t seq = sequenceNumber_++;
    auto packet = buildIcmpEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = sendto(sock.get(), packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        result.errorMessage = std::string("Failed to send ICMP packet: ") + std::strerror(errno);
        return result;
    }

    std::array<uint8_t, 1024> recvBuffer{};

    // A raw socket sees every ICMP packet on the host, so keep reading until
    // our own reply arrives or the deadline passes.
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.errorMessage = "Timeout";
            return result;
        }

        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            result.errorMessage = std::string("poll failed: ") + std::strerror(errno);
            return result;
        }
        if (ready == 0) {
            result.errorMessage = "Timeout";
            return result;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = std::chrono::steady_clock::now();

        if (received < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            result.errorMessage = std::string("Receive error: ") + std::strerror(errno);
            return result;
        }
        if (from.sin_addr.s_addr != dest.sin_addr.s_addr) {
            continue;
        }

        // Raw sockets deliver the IP header, datagram ping sockets do not.
        size_t offset = 0;
        if (raw) {
            if (received < 20) {
                continue;
            }
            offset = static_cast<size_t>((recvBuffer[0] & 0x0F) * 4);
        }
        if (static_cast<size_t>(received) < offset + ICMP_HEADER_SIZE) {
            continue;
        }

        const uint8_t* icmp = recvBuffer.data() + offset;
        if (icmp[0] != ICMP_ECHO_REPLY) {
            continue;
        }

        uint16_t recvId = static_cast<uint16_t>((icmp[4] << 8) | icmp[5]);
        uint16_t recvSeq = static_cast<uint16_t>((icmp[6] << 8) | icmp[7]);
        // The kernel rewrites the identifier of datagram ping sockets
        if (recvSeq != seq || (raw && recvId != identifier_)) {
            continue;
        }

        result.success = true;
        result.latency =
            std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime);
        if (raw) {
            result.ttl = recvBuffer[8];
        }
        spdlog::debug("Ping to {} successful: {:.2f}ms", address, result.latencyMs());
        return result;
    }
}

core::PingResult PingService::pingWithSystemBinary(const std::string& address,
                                                   std::chrono::milliseconds timeout) {
    core::PingResult result;
    result.address = address;
    result.timestamp = std::chrono::system_clock::now();
    result.method = core::PingMethod::SystemPing;

    struct in_addr parsed {};
    if (inet_pton(AF_INET, address.c_str(), &parsed) != 1) {
        result.errorMessage = "Invalid address";
        return result;
    }

    // -W takes whole seconds
    auto waitSeconds = std::to_string(std::max<long long>(1, (timeout.count() + 999) / 1000));
    std::vector<std::string> args = {"ping", "-n", "-c", "1", "-W", waitSeconds, address};
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    auto start = std::chrono::steady_clock::now();
    pid_t pid = 0;
    int rc = posix_spawnp(&pid, "ping", &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        result.errorMessage = std::string("Failed to start ping: ") + std::strerror(rc);
        spdlog::debug("Ping to {} failed: {}", address, result.errorMessage);
        return result;
    }

    auto deadline = start + timeout + SYSTEM_PING_GRACE;
    int status = 0;

    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            result.success = WIFEXITED(status) && WEXITSTATUS(status) == 0;
            if (result.success) {
                result.latency = std::chrono::duration_cast<std::chrono::microseconds>(
                    std::chrono::steady_clock::now() - start);
            } else {
                result.errorMessage = "Host did not answer";
            }
            return result;
        }
        if (done < 0 && errno != EINTR) {
            result.errorMessage = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            result.errorMessage = "Timeout";
            return result;
        }
        std::this_thread::sleep_for(SYSTEM_PING_POLL);
    }
}

} // namespace devsweep::infra
