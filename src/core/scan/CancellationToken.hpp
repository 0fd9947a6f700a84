#pragma once

#include <atomic>

namespace devsweep::core {

/**
 * @brief Cooperative cancellation flag shared by every worker of a sweep.
 *
 * Workers check it between targets, never during a probe. After cancel()
 * the sweep drains within roughly one probe timeout per in-flight target.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace devsweep::core
