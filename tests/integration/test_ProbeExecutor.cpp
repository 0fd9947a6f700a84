#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_message.hpp>

#include "LoopbackServer.hpp"
#include "core/protocol/ServiceHandshake.hpp"
#include "core/services/IPingService.hpp"
#include "infrastructure/network/ProbeExecutor.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <system_error>
#include <thread>

using namespace devsweep::core;
using namespace devsweep::infra;
using devsweep::test::LoopbackServer;
using devsweep::test::bytes;
using devsweep::test::closedLoopbackPort;

namespace {

constexpr uint32_t LOOPBACK = 0x7F000001u;
constexpr auto TIMEOUT = std::chrono::milliseconds(300);

class FakePingService : public IPingService {
public:
    explicit FakePingService(bool reachable) : reachable_(reachable) {}

    PingResult ping(const std::string& address, std::chrono::milliseconds) override {
        calls_.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        PingResult result;
        result.address = address;
        result.timestamp = std::chrono::system_clock::now();
        result.success = reachable_;
        if (!reachable_) {
            result.errorMessage = "Timeout";
        }
        return result;
    }

    int calls() const { return calls_.load(); }

private:
    bool reachable_;
    std::atomic<int> calls_{0};
};

ScanFlags noPing() {
    ScanFlags flags;
    flags.skipPing = true;
    return flags;
}

std::vector<uint8_t> adbConnectReply() {
    std::vector<uint8_t> reply;
    for (uint32_t word : {ADB_CMD_CNXN, ADB_VERSION, ADB_MAX_PAYLOAD, 0u, 0u,
                          ADB_CMD_CNXN ^ 0xFFFFFFFFu}) {
        for (int shift = 0; shift < 32; shift += 8) {
            reply.push_back(static_cast<uint8_t>((word >> shift) & 0xFF));
        }
    }
    return reply;
}

std::unique_ptr<LoopbackServer> tryListen(std::vector<uint8_t> reply, size_t expectBytes,
                                          uint16_t port) {
    try {
        return std::make_unique<LoopbackServer>(std::move(reply), expectBytes, port);
    } catch (const std::system_error& e) {
        WARN("Cannot listen on port " << port << ": " << e.what());
        return nullptr;
    }
}

} // namespace

TEST_CASE("ProbeExecutor classifies loopback services", "[ProbeExecutor][integration]") {
    FakePingService ping(true);
    ProbeExecutor executor(ping);

    SECTION("SSH banner") {
        LoopbackServer server(bytes("SSH-2.0-OpenSSH_9.6p1 Ubuntu-3\r\n"));

        auto result = executor.probe({LOOPBACK, server.port()}, TIMEOUT, noPing());

        REQUIRE(result.open);
        REQUIRE(result.deviceType == DeviceType::SSH);
        REQUIRE(result.banner == "SSH-2.0-OpenSSH_9.6p1 Ubuntu-3");
        REQUIRE_FALSE(result.error.has_value());
        REQUIRE_FALSE(result.reachable.has_value());
        REQUIRE(result.target.port == server.port());
    }

    SECTION("Telnet negotiation on a non-standard port") {
        LoopbackServer server({0xFF, 0xFD, 0x18, 0xFF, 0xFD, 0x20});

        auto result = executor.probe({LOOPBACK, server.port()}, TIMEOUT, noPing());

        REQUIRE(result.open);
        REQUIRE(result.deviceType == DeviceType::Telnet);
        REQUIRE(result.banner.has_value());
    }

    SECTION("Unrecognized service stays Unknown") {
        LoopbackServer server(bytes("220 ftp.example.com FTP ready\r\n"));

        auto result = executor.probe({LOOPBACK, server.port()}, TIMEOUT, noPing());

        REQUIRE(result.open);
        REQUIRE(result.deviceType == DeviceType::Unknown);
        REQUIRE(result.banner == "220 ftp.example.com FTP ready");
    }

    SECTION("SSH classification can be disabled") {
        LoopbackServer server(bytes("SSH-2.0-dropbear\r\n"));
        auto flags = noPing();
        flags.scanSsh = false;

        auto result = executor.probe({LOOPBACK, server.port()}, TIMEOUT, flags);

        REQUIRE(result.open);
        REQUIRE(result.deviceType == DeviceType::Unknown);
    }
}

TEST_CASE("ProbeExecutor ADB handshakes", "[ProbeExecutor][integration]") {
    FakePingService ping(true);
    ProbeExecutor executor(ping);

    SECTION("Device port answers CNXN") {
        auto connect = ServiceHandshake::buildAdbConnect();
        auto server = tryListen(adbConnectReply(), connect.size(), ADB_DEVICE_PORT);
        if (!server) {
            SKIP("Port 5555 is in use on this machine");
        }

        auto result = executor.probe({LOOPBACK, ADB_DEVICE_PORT}, TIMEOUT, noPing());

        REQUIRE(result.open);
        REQUIRE(result.deviceType == DeviceType::ADB);
        REQUIRE(server->received() == connect);
    }

    SECTION("Host server answers OKAY") {
        auto request = ServiceHandshake::buildAdbServerVersionRequest();
        auto server = tryListen(bytes("OKAY00040029"), request.size(), ADB_SERVER_PORT);
        if (!server) {
            SKIP("Port 5037 is in use on this machine");
        }

        auto result = executor.probe({LOOPBACK, ADB_SERVER_PORT}, TIMEOUT, noPing());

        REQUIRE(result.open);
        REQUIRE(result.deviceType == DeviceType::ADB);
        REQUIRE(server->received() == request);
    }
}

TEST_CASE("ProbeExecutor failure modes", "[ProbeExecutor][integration]") {
    FakePingService ping(true);
    ProbeExecutor executor(ping);

    SECTION("Closed port is refused") {
        auto port = closedLoopbackPort();

        auto result = executor.probe({LOOPBACK, port}, TIMEOUT, noPing());

        REQUIRE_FALSE(result.open);
        REQUIRE(result.deviceType == DeviceType::Unknown);
        REQUIRE(result.error == ProbeError::ConnectionRefused);
        REQUIRE_FALSE(result.banner.has_value());
    }

    SECTION("Silent service times out in the handshake") {
        LoopbackServer server({});

        auto start = std::chrono::steady_clock::now();
        auto result = executor.probe({LOOPBACK, server.port()}, TIMEOUT, noPing());
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(result.open);
        REQUIRE(result.deviceType == DeviceType::Unknown);
        REQUIRE(result.error == ProbeError::HandshakeTimeout);
        REQUIRE_FALSE(result.banner.has_value());

        // Connect and handshake each get their own budget
        REQUIRE(elapsed >= TIMEOUT);
        REQUIRE(elapsed < TIMEOUT * 2 + std::chrono::milliseconds(500));
        REQUIRE(result.elapsed >= TIMEOUT);
    }

    SECTION("Unroutable address fails within the timeout") {
        // TEST-NET-1 is never routed
        auto start = std::chrono::steady_clock::now();
        auto result = executor.probe({0xC0000201u, 22}, TIMEOUT, noPing());
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE_FALSE(result.open);
        REQUIRE(result.error.has_value());
        REQUIRE(elapsed < TIMEOUT + std::chrono::milliseconds(500));
    }
}

TEST_CASE("ProbeExecutor reachability check", "[ProbeExecutor][integration]") {
    SECTION("Unreachable host is not connected to") {
        FakePingService ping(false);
        ProbeExecutor executor(ping);
        LoopbackServer server(bytes("SSH-2.0-test\r\n"));

        auto result = executor.probe({LOOPBACK, server.port()}, TIMEOUT, ScanFlags{});

        REQUIRE(result.reachable == false);
        REQUIRE_FALSE(result.open);
        REQUIRE(result.deviceType == DeviceType::Unreachable);
        REQUIRE(result.error == ProbeError::UnreachableHost);
        REQUIRE(server.connectionCount() == 0);
    }

    SECTION("Reachable host is probed") {
        FakePingService ping(true);
        ProbeExecutor executor(ping);
        LoopbackServer server(bytes("SSH-2.0-test\r\n"));

        auto result = executor.probe({LOOPBACK, server.port()}, TIMEOUT, ScanFlags{});

        REQUIRE(result.reachable == true);
        REQUIRE(result.open);
        REQUIRE(result.deviceType == DeviceType::SSH);
    }

    SECTION("One ping per address, even for concurrent probes") {
        FakePingService ping(true);
        ProbeExecutor executor(ping);
        auto port = closedLoopbackPort();

        std::vector<std::thread> threads;
        for (int i = 0; i < 4; ++i) {
            threads.emplace_back(
                [&]() { executor.probe({LOOPBACK, port}, TIMEOUT, ScanFlags{}); });
        }
        for (auto& t : threads) {
            t.join();
        }

        REQUIRE(ping.calls() == 1);

        executor.probe({LOOPBACK + 1, port}, TIMEOUT, ScanFlags{});
        REQUIRE(ping.calls() == 2);
    }

    SECTION("Skipping the check never pings") {
        FakePingService ping(false);
        ProbeExecutor executor(ping);
        LoopbackServer server(bytes("SSH-2.0-test\r\n"));

        auto result = executor.probe({LOOPBACK, server.port()}, TIMEOUT, noPing());

        REQUIRE(ping.calls() == 0);
        REQUIRE(result.open);
    }
}
