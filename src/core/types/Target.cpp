#include "core/types/Target.hpp"

#include <cctype>

namespace devsweep::core {

std::string Target::ip() const {
    return addressToString(address);
}

std::string Target::toString() const {
    return ip() + ":" + std::to_string(port);
}

std::string Target::addressToString(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." + std::to_string((address >> 16) & 0xFF) +
           "." + std::to_string((address >> 8) & 0xFF) + "." + std::to_string(address & 0xFF);
}

std::optional<uint32_t> Target::addressFromString(const std::string& str) {
    uint32_t address = 0;
    int octets = 0;
    size_t pos = 0;

    while (octets < 4) {
        size_t digits = 0;
        uint32_t value = 0;
        while (pos < str.size() && std::isdigit(static_cast<unsigned char>(str[pos]))) {
            value = value * 10 + static_cast<uint32_t>(str[pos] - '0');
            ++pos;
            if (++digits > 3) {
                return std::nullopt;
            }
        }

        if (digits == 0 || value > 255) {
            return std::nullopt;
        }

        address = (address << 8) | value;
        ++octets;

        if (octets < 4) {
            if (pos >= str.size() || str[pos] != '.') {
                return std::nullopt;
            }
            ++pos;
        }
    }

    if (pos != str.size()) {
        return std::nullopt;
    }
    return address;
}

} // namespace devsweep::core
