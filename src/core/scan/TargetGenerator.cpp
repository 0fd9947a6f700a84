#include "core/scan/TargetGenerator.hpp"

#include <algorithm>

namespace devsweep::core {

TargetGenerator::TargetGenerator(uint32_t startAddress, uint32_t endAddress,
                                 std::vector<uint16_t> ports)
    : startAddress_(startAddress), ports_(std::move(ports)),
      total_(endAddress >= startAddress
                 ? (static_cast<uint64_t>(endAddress) - startAddress + 1) * ports_.size()
                 : 0) {}

TargetGenerator::TargetGenerator(const ValidatedConfig& config)
    : TargetGenerator(config.startAddress, config.endAddress, config.ports) {}

std::optional<Target> TargetGenerator::next() {
    // fetch_add never wraps in practice: at most 2^32 * 65535 targets.
    uint64_t index = cursor_.fetch_add(1, std::memory_order_relaxed);
    if (index >= total_) {
        return std::nullopt;
    }
    return at(index);
}

uint64_t TargetGenerator::dispatched() const {
    return std::min(cursor_.load(std::memory_order_relaxed), total_);
}

Target TargetGenerator::at(uint64_t index) const {
    const uint64_t portCount = ports_.size();
    Target target;
    target.address = startAddress_ + static_cast<uint32_t>(index / portCount);
    target.port = ports_[static_cast<size_t>(index % portCount)];
    return target;
}

} // namespace devsweep::core
