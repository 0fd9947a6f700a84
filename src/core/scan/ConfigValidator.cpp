#include "core/scan/ConfigValidator.hpp"

#include "core/protocol/ServiceHandshake.hpp"
#include "core/types/Target.hpp"

#include <spdlog/spdlog.h>

#include <charconv>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace devsweep::core {

namespace {

std::string trim(const std::string& str) {
    auto first = str.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    auto last = str.find_last_not_of(" \t");
    return str.substr(first, last - first + 1);
}

// Digits only; values too large for uint64_t saturate so they fail the port bound.
std::optional<uint64_t> parseNumber(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        return std::numeric_limits<uint64_t>::max();
    }
    if (ec != std::errc()) {
        return std::nullopt;
    }
    return value;
}

ValidationError specError(const std::string& spec, const std::string& detail) {
    return {ValidationErrorKind::InvalidPortSpec,
            "Invalid port specification '" + spec + "': " + detail};
}

ValidationError portError(const std::string& item) {
    return {ValidationErrorKind::InvalidPort, "Invalid port " + item + " (1-65535)"};
}

} // namespace

bool ConfigValidator::isValidIp(const std::string& ip) {
    return Target::addressFromString(ip).has_value();
}

PortSpecResult ConfigValidator::parsePortSpec(const std::string& spec) {
    std::vector<uint16_t> ports;
    std::unordered_set<uint16_t> seen;

    auto addPort = [&](uint16_t port) {
        if (seen.insert(port).second) {
            ports.push_back(port);
        }
    };

    if (trim(spec).empty()) {
        return ports;
    }

    size_t start = 0;
    while (start <= spec.size()) {
        auto comma = spec.find(',', start);
        if (comma == std::string::npos) {
            comma = spec.size();
        }
        auto item = trim(spec.substr(start, comma - start));
        start = comma + 1;

        if (item.empty()) {
            return specError(spec, "empty entry");
        }

        auto dash = item.find('-');
        if (dash == std::string::npos) {
            auto value = parseNumber(item);
            if (!value) {
                return specError(spec, "'" + item + "' is not a number");
            }
            if (*value < 1 || *value > 65535) {
                return portError(item);
            }
            addPort(static_cast<uint16_t>(*value));
            continue;
        }

        auto lowStr = trim(item.substr(0, dash));
        auto highStr = trim(item.substr(dash + 1));
        auto low = parseNumber(lowStr);
        auto high = parseNumber(highStr);
        if (!low || !high) {
            return specError(spec, "'" + item + "' is not a range of the form a-b");
        }
        if (*low < 1 || *low > 65535) {
            return portError(lowStr);
        }
        if (*high < 1 || *high > 65535) {
            return portError(highStr);
        }
        if (*low > *high) {
            return specError(spec, "range start " + lowStr + " is above range end " + highStr);
        }
        for (uint64_t port = *low; port <= *high; ++port) {
            addPort(static_cast<uint16_t>(port));
        }
    }

    return ports;
}

ValidationResult ConfigValidator::validate(const ScanConfig& config) {
    auto startAddress = Target::addressFromString(config.startIp);
    if (!startAddress) {
        return ValidationError{ValidationErrorKind::InvalidIP,
                               "Invalid start IP: '" + config.startIp + "'"};
    }

    auto endAddress = Target::addressFromString(config.endIp);
    if (!endAddress) {
        return ValidationError{ValidationErrorKind::InvalidIP,
                               "Invalid end IP: '" + config.endIp + "'"};
    }

    if (*startAddress > *endAddress) {
        return ValidationError{ValidationErrorKind::InvalidRange,
                               "Start IP " + config.startIp + " is above end IP " + config.endIp};
    }

    ValidatedConfig validated;
    validated.startAddress = *startAddress;
    validated.endAddress = *endAddress;
    validated.flags = config.flags;

    int threads = config.threads;
    double timeoutSeconds = config.timeoutSeconds;

    if (config.profile && !config.profile->empty()) {
        auto resolved = ProfileResolver::resolve(*config.profile);
        if (auto* error = std::get_if<ValidationError>(&resolved)) {
            return *error;
        }
        const auto& settings = std::get<ProfileSettings>(resolved);
        threads = settings.threads;
        timeoutSeconds = settings.timeoutSeconds;
        validated.profile = ProfileResolver::fromString(*config.profile);
    }

    if (threads < MIN_THREADS) {
        return ValidationError{ValidationErrorKind::InvalidThreadCount,
                               "Invalid thread count " + std::to_string(threads) + " (1-200)"};
    }
    if (threads > MAX_THREADS) {
        spdlog::warn("Thread count {} capped at {}", threads, MAX_THREADS);
        threads = MAX_THREADS;
        validated.threadsClamped = true;
    }
    validated.threads = threads;

    // Written so that NaN fails too
    if (!(timeoutSeconds >= MIN_TIMEOUT_SECONDS && timeoutSeconds <= MAX_TIMEOUT_SECONDS)) {
        return ValidationError{ValidationErrorKind::InvalidTimeout,
                               "Invalid timeout " + std::to_string(timeoutSeconds) +
                                   "s (0.1-10.0)"};
    }
    validated.timeout = std::chrono::milliseconds(std::llround(timeoutSeconds * 1000.0));

    auto ports = parsePortSpec(config.portSpec);
    if (auto* error = std::get_if<ValidationError>(&ports)) {
        return *error;
    }
    validated.ports = std::get<std::vector<uint16_t>>(std::move(ports));

    if (validated.ports.empty()) {
        validated.ports = ServiceHandshake::defaultPorts(config.flags);
        if (validated.ports.empty()) {
            return ValidationError{ValidationErrorKind::InvalidPortSpec,
                                   "No ports to scan: the port list is empty and ADB, SSH and "
                                   "Telnet are all disabled"};
        }
    }

    auto total = validated.totalTargets();
    if (config.maxTargets && *config.maxTargets > 0 && total > *config.maxTargets) {
        return ValidationError{ValidationErrorKind::InvalidRange,
                               "Sweep of " + std::to_string(total) + " targets exceeds the limit of " +
                                   std::to_string(*config.maxTargets)};
    }
    if (total > LARGE_SWEEP_TARGETS) {
        spdlog::warn("Large sweep: {} hosts x {} ports = {} targets", validated.hostCount(),
                     validated.ports.size(), total);
    }

    return validated;
}

} // namespace devsweep::core
