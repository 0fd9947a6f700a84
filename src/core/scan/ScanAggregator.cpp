#include "core/scan/ScanAggregator.hpp"

#include <algorithm>
#include <iterator>

namespace devsweep::core {

ScanAggregator::ScanAggregator(uint64_t totalTargets, std::vector<uint16_t> portOrder)
    : totalTargets_(totalTargets) {
    for (size_t i = 0; i < portOrder.size(); ++i) {
        portRank_.emplace(portOrder[i], i);
    }
}

void ScanAggregator::markStarted() {
    std::lock_guard lock(countersMutex_);
    if (!startTime_) {
        startTime_ = std::chrono::steady_clock::now();
    }
}

void ScanAggregator::markFinished() {
    std::lock_guard lock(countersMutex_);
    if (!finalElapsed_) {
        finalElapsed_ = elapsedLocked();
    }
}

void ScanAggregator::record(const ProbeResult& result) {
    const bool isOpen = result.open;

    {
        std::lock_guard lock(resultsMutex_);
        results_.push_back(result);
    }

    ScanProgress progress;
    {
        std::lock_guard lock(countersMutex_);
        ++scanned_;
        if (isOpen) {
            ++open_;
        }
        progress.totalTargets = totalTargets_;
        progress.scannedTargets = scanned_;
        progress.openTargets = open_;
        progress.elapsed = elapsedLocked();
    }

    if (resultCallback_) {
        resultCallback_(result);
    }
    if (progressCallback_) {
        std::lock_guard lock(deliveryMutex_);
        // A worker that lost the race to a later count has nothing new to report
        if (progress.scannedTargets <= lastDelivered_) {
            return;
        }
        lastDelivered_ = progress.scannedTargets;
        progressCallback_(progress);
    }
}

ScanProgress ScanAggregator::snapshot() const {
    std::lock_guard lock(countersMutex_);
    ScanProgress progress;
    progress.totalTargets = totalTargets_;
    progress.scannedTargets = scanned_;
    progress.openTargets = open_;
    progress.elapsed = elapsedLocked();
    return progress;
}

std::vector<ProbeResult> ScanAggregator::results() const {
    std::vector<ProbeResult> copy;
    {
        std::lock_guard lock(resultsMutex_);
        copy = results_;
    }
    sortByScanOrder(copy);
    return copy;
}

std::vector<ProbeResult> ScanAggregator::openResults() const {
    std::vector<ProbeResult> copy;
    {
        std::lock_guard lock(resultsMutex_);
        std::copy_if(results_.begin(), results_.end(), std::back_inserter(copy),
                     [](const ProbeResult& r) { return r.open; });
    }
    sortByScanOrder(copy);
    return copy;
}

size_t ScanAggregator::resultCount() const {
    std::lock_guard lock(resultsMutex_);
    return results_.size();
}

void ScanAggregator::sortByScanOrder(std::vector<ProbeResult>& results) const {
    auto rank = [this](uint16_t port) {
        auto it = portRank_.find(port);
        // Ports outside the scan order sort after it, numerically
        return it != portRank_.end() ? it->second : portRank_.size() + port;
    };

    std::stable_sort(results.begin(), results.end(),
                     [&rank](const ProbeResult& a, const ProbeResult& b) {
                         if (a.target.address != b.target.address) {
                             return a.target.address < b.target.address;
                         }
                         return rank(a.target.port) < rank(b.target.port);
                     });
}

std::chrono::milliseconds ScanAggregator::elapsedLocked() const {
    if (finalElapsed_) {
        return *finalElapsed_;
    }
    if (!startTime_) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                 *startTime_);
}

} // namespace devsweep::core
