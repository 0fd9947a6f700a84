#include "core/protocol/ServiceHandshake.hpp"

#include <algorithm>
#include <cstring>

namespace devsweep::core {

namespace {

constexpr uint8_t TELNET_IAC = 0xFF;
constexpr uint8_t TELNET_WILL = 0xFB;
constexpr uint8_t TELNET_DONT = 0xFE;

void appendLe32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

uint32_t readLe32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0]) | (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) | (static_cast<uint32_t>(data[3]) << 24);
}

bool startsWith(const std::vector<uint8_t>& data, const char* prefix) {
    size_t len = std::strlen(prefix);
    return data.size() >= len && std::memcmp(data.data(), prefix, len) == 0;
}

bool isPrintable(uint8_t byte) {
    return byte >= 0x20 && byte < 0x7F;
}

// Leading line breaks are skipped, as in sanitizeBanner()
bool startsPrintable(const std::vector<uint8_t>& data) {
    auto first = std::find_if(data.begin(), data.end(),
                              [](uint8_t byte) { return byte != '\r' && byte != '\n'; });
    return first != data.end() && isPrintable(*first);
}

} // namespace

HandshakeKind ServiceHandshake::handshakeFor(uint16_t port, const ScanFlags& flags) {
    if (flags.scanAdb && port == ADB_DEVICE_PORT) {
        return HandshakeKind::AdbDevice;
    }
    if (flags.scanAdb && port == ADB_SERVER_PORT) {
        return HandshakeKind::AdbServer;
    }
    return HandshakeKind::BannerRead;
}

std::vector<uint8_t> ServiceHandshake::requestFor(HandshakeKind kind) {
    switch (kind) {
    case HandshakeKind::AdbDevice:
        return buildAdbConnect();
    case HandshakeKind::AdbServer:
        return buildAdbServerVersionRequest();
    case HandshakeKind::BannerRead:
        return {};
    }
    return {};
}

size_t ServiceHandshake::expectedReplySize(HandshakeKind kind) {
    switch (kind) {
    case HandshakeKind::AdbDevice:
        return ADB_HEADER_SIZE;
    case HandshakeKind::AdbServer:
        return 4;
    case HandshakeKind::BannerRead:
        return 1;
    }
    return 1;
}

std::vector<uint8_t> ServiceHandshake::buildAdbConnect() {
    // "host::" including the terminating NUL
    static constexpr uint8_t payload[] = {'h', 'o', 's', 't', ':', ':', '\0'};
    const size_t payloadSize = sizeof(payload);

    uint32_t checksum = 0;
    for (size_t i = 0; i < payloadSize; ++i) {
        checksum += payload[i];
    }

    std::vector<uint8_t> packet;
    packet.reserve(ADB_HEADER_SIZE + payloadSize);
    appendLe32(packet, ADB_CMD_CNXN);
    appendLe32(packet, ADB_VERSION);
    appendLe32(packet, ADB_MAX_PAYLOAD);
    appendLe32(packet, static_cast<uint32_t>(payloadSize));
    appendLe32(packet, checksum);
    appendLe32(packet, ADB_CMD_CNXN ^ 0xFFFFFFFFu);
    packet.insert(packet.end(), payload, payload + payloadSize);
    return packet;
}

std::vector<uint8_t> ServiceHandshake::buildAdbServerVersionRequest() {
    // Smart-socket framing: 4 hex digits of length, then the service name.
    static const char request[] = "000chost:version";
    return {request, request + sizeof(request) - 1};
}

std::optional<AdbHeader> ServiceHandshake::parseAdbHeader(const std::vector<uint8_t>& data) {
    if (data.size() < ADB_HEADER_SIZE) {
        return std::nullopt;
    }

    AdbHeader header;
    header.command = readLe32(&data[0]);
    header.arg0 = readLe32(&data[4]);
    header.arg1 = readLe32(&data[8]);
    header.dataLength = readLe32(&data[12]);
    header.dataChecksum = readLe32(&data[16]);
    header.magic = readLe32(&data[20]);
    return header;
}

DeviceType ServiceHandshake::classify(uint16_t port, const ScanFlags& flags,
                                      const std::vector<uint8_t>& reply) {
    if (reply.empty()) {
        return DeviceType::Unknown;
    }

    switch (handshakeFor(port, flags)) {
    case HandshakeKind::AdbDevice: {
        auto header = parseAdbHeader(reply);
        if (header && header->hasValidMagic() &&
            (header->command == ADB_CMD_CNXN || header->command == ADB_CMD_AUTH)) {
            return DeviceType::ADB;
        }
        break;
    }
    case HandshakeKind::AdbServer:
        if (startsWith(reply, "OKAY")) {
            return DeviceType::ADB;
        }
        break;
    case HandshakeKind::BannerRead:
        break;
    }

    if (flags.scanSsh && startsWith(reply, "SSH-")) {
        return DeviceType::SSH;
    }

    if (flags.scanTelnet) {
        if (port == TELNET_PORT && (reply[0] == TELNET_IAC || startsPrintable(reply))) {
            return DeviceType::Telnet;
        }
        // Option negotiation (IAC WILL/WONT/DO/DONT) on a non-standard port
        if (reply.size() >= 2 && reply[0] == TELNET_IAC && reply[1] >= TELNET_WILL &&
            reply[1] <= TELNET_DONT) {
            return DeviceType::Telnet;
        }
    }

    return DeviceType::Unknown;
}

std::string ServiceHandshake::sanitizeBanner(const std::vector<uint8_t>& reply) {
    std::string banner;
    banner.reserve(std::min(reply.size(), MAX_BANNER_LENGTH));

    for (uint8_t byte : reply) {
        if (banner.size() >= MAX_BANNER_LENGTH) {
            break;
        }
        if (byte == '\r' || byte == '\n') {
            if (banner.empty()) {
                continue;
            }
            break;
        }
        banner.push_back(isPrintable(byte) ? static_cast<char>(byte) : '.');
    }

    return banner;
}

std::vector<uint16_t> ServiceHandshake::defaultPorts(const ScanFlags& flags) {
    std::vector<uint16_t> ports;
    if (flags.scanAdb) {
        ports.push_back(ADB_SERVER_PORT);
        ports.push_back(ADB_DEVICE_PORT);
    }
    if (flags.scanSsh) {
        ports.push_back(SSH_PORT);
    }
    if (flags.scanTelnet) {
        ports.push_back(TELNET_PORT);
    }
    return ports;
}

} // namespace devsweep::core
