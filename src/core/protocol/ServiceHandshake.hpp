/**
 * @file ServiceHandshake.hpp
 * @brief Minimal per-port handshakes used to classify open services.
 *
 * Only enough of each protocol is implemented to recognize it: the ADB
 * CNXN exchange on the device port, the ADB host server's version request,
 * and passive banner reads for SSH and Telnet.
 */

#pragma once

#include "core/types/ProbeResult.hpp"
#include "core/types/ScanConfig.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace devsweep::core {

constexpr uint16_t ADB_SERVER_PORT = 5037;
constexpr uint16_t ADB_DEVICE_PORT = 5555;
constexpr uint16_t SSH_PORT = 22;
constexpr uint16_t TELNET_PORT = 23;

constexpr uint32_t ADB_CMD_CNXN = 0x4e584e43;
constexpr uint32_t ADB_CMD_AUTH = 0x48545541;
constexpr uint32_t ADB_VERSION = 0x01000000;
constexpr uint32_t ADB_MAX_PAYLOAD = 4096;
constexpr size_t ADB_HEADER_SIZE = 24;

/// Banners are kept at most this long, in results and in logs.
constexpr size_t MAX_BANNER_LENGTH = 128;

/**
 * @brief Decoded ADB message header (all fields little-endian on the wire).
 */
struct AdbHeader {
    uint32_t command{0};
    uint32_t arg0{0};
    uint32_t arg1{0};
    uint32_t dataLength{0};
    uint32_t dataChecksum{0};
    uint32_t magic{0};

    /**
     * @brief Checks that magic is the bitwise complement of command.
     */
    [[nodiscard]] bool hasValidMagic() const { return magic == (command ^ 0xFFFFFFFFu); }
};

/**
 * @brief What to do after a connection succeeds.
 */
enum class HandshakeKind : int {
    AdbDevice = 0, ///< Send CNXN, expect CNXN or AUTH
    AdbServer = 1, ///< Send "host:version", expect OKAY
    BannerRead = 2 ///< Send nothing, read what the server volunteers
};

/**
 * @brief Stateless helpers for building requests and classifying replies.
 */
class ServiceHandshake {
public:
    /**
     * @brief Chooses the handshake for a port given the enabled services.
     */
    static HandshakeKind handshakeFor(uint16_t port, const ScanFlags& flags);

    /**
     * @brief Returns the bytes to send first, empty for BannerRead.
     */
    static std::vector<uint8_t> requestFor(HandshakeKind kind);

    /**
     * @brief Minimum reply length worth waiting for.
     */
    static size_t expectedReplySize(HandshakeKind kind);

    /**
     * @brief Builds an ADB CNXN message with a "host::" system identity.
     */
    static std::vector<uint8_t> buildAdbConnect();

    /**
     * @brief Builds the ADB host server's smart-socket version request.
     */
    static std::vector<uint8_t> buildAdbServerVersionRequest();

    /**
     * @brief Decodes an ADB header from the first 24 bytes of a reply.
     * @return The header, or nullopt if fewer than 24 bytes are available.
     */
    static std::optional<AdbHeader> parseAdbHeader(const std::vector<uint8_t>& data);

    /**
     * @brief Classifies a reply received on an open port.
     * @param port The target port.
     * @param flags Enabled services; disabled services are never reported.
     * @param reply Bytes received after the handshake request, possibly empty.
     * @return ADB, SSH or Telnet when recognized, Unknown otherwise.
     */
    static DeviceType classify(uint16_t port, const ScanFlags& flags,
                               const std::vector<uint8_t>& reply);

    /**
     * @brief Makes a reply safe to store and log.
     *
     * Skips leading line breaks and stops at the next one. The result is at
     * most MAX_BANNER_LENGTH long, with non-printable bytes shown as '.'.
     */
    static std::string sanitizeBanner(const std::vector<uint8_t>& reply);

    /**
     * @brief Default ports of the enabled services.
     * @return Subset of {5037, 5555, 22, 23}, in that order.
     */
    static std::vector<uint16_t> defaultPorts(const ScanFlags& flags);
};

} // namespace devsweep::core
