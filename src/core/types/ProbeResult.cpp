#include "core/types/ProbeResult.hpp"

namespace devsweep::core {

std::string ProbeResult::deviceTypeToString() const {
    return deviceTypeToString(deviceType);
}

std::string ProbeResult::deviceTypeToString(DeviceType type) {
    switch (type) {
    case DeviceType::Unknown:
        return "Unknown";
    case DeviceType::ADB:
        return "ADB";
    case DeviceType::SSH:
        return "SSH";
    case DeviceType::Telnet:
        return "Telnet";
    case DeviceType::Unreachable:
        return "Unreachable";
    }
    return "Unknown";
}

DeviceType ProbeResult::deviceTypeFromString(const std::string& str) {
    if (str == "ADB")
        return DeviceType::ADB;
    if (str == "SSH")
        return DeviceType::SSH;
    if (str == "Telnet")
        return DeviceType::Telnet;
    if (str == "Unreachable")
        return DeviceType::Unreachable;
    return DeviceType::Unknown;
}

std::string ProbeResult::errorToString(ProbeError error) {
    switch (error) {
    case ProbeError::ConnectionRefused:
        return "ConnectionRefused";
    case ProbeError::ConnectionTimeout:
        return "ConnectionTimeout";
    case ProbeError::HandshakeTimeout:
        return "HandshakeTimeout";
    case ProbeError::UnreachableHost:
        return "UnreachableHost";
    case ProbeError::ProbeFailed:
        return "ProbeFailed";
    }
    return "ProbeFailed";
}

} // namespace devsweep::core
