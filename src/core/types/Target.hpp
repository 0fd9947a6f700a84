/**
 * @file Target.hpp
 * @brief A single (IPv4 address, port) pair to probe.
 *
 * Addresses are kept as 32-bit integers in host byte order so that ranges
 * can be compared and iterated arithmetically.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace devsweep::core {

/**
 * @brief One unit of scan work.
 *
 * Generated once by the TargetGenerator, consumed once by a worker and
 * never modified afterwards.
 */
struct Target {
    uint32_t address{0}; ///< IPv4 address in host byte order
    uint16_t port{0};    ///< TCP port

    /**
     * @brief Formats the address in dotted-quad notation.
     * @return Address string (e.g., "192.168.1.10").
     */
    [[nodiscard]] std::string ip() const;

    /**
     * @brief Formats the target as "ip:port".
     */
    [[nodiscard]] std::string toString() const;

    /**
     * @brief Converts a host-order address to dotted-quad notation.
     * @param address IPv4 address in host byte order.
     * @return Dotted-quad string.
     */
    static std::string addressToString(uint32_t address);

    /**
     * @brief Parses a strict dotted-quad IPv4 address.
     *
     * Accepts exactly four dot-separated groups of one to three decimal
     * digits, each in [0,255]. No whitespace, signs or hostnames.
     *
     * @param str The string to parse.
     * @return Address in host byte order, or nullopt if malformed.
     */
    static std::optional<uint32_t> addressFromString(const std::string& str);

    bool operator==(const Target& other) const = default;
};

} // namespace devsweep::core
