/**
 * CancellationController.hpp - Generation epochs for a session
 *
 * Every assistant-side task captures the epoch at creation. Emissions go
 * through emitIfCurrent(), which checks the captured epoch under the same
 * lock cancel() takes, so nothing from an older epoch can slip out after
 * cancel() returns.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

namespace emv::core {

class CancellationController {
public:
    CancellationController() = default;

    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    uint64_t current() const { return epoch_.load(); }

    bool isCurrent(uint64_t generation) const { return epoch_.load() == generation; }

    /**
     * Serialize with other cancellations, bump the epoch and run `under_lock`
     * with the new value before the lock is released.
     * @return the new epoch
     */
    uint64_t cancel(const std::function<void(uint64_t)>& under_lock = {}) {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t next = epoch_.load() + 1;
        epoch_.store(next);
        if (under_lock) under_lock(next);
        return next;
    }

    /**
     * Run `emit` only while `generation` is still the current epoch.
     * @return false if the generation was superseded (nothing emitted)
     */
    template <typename Fn>
    bool emitIfCurrent(uint64_t generation, Fn&& emit) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch_.load() != generation) return false;
        emit();
        return true;
    }

private:
    std::mutex mutex_;
    std::atomic<uint64_t> epoch_{0};
};

} // namespace emv::core
