#pragma once

#include <atomic>

namespace parafetch {

enum class CancelLevel : int {
    None = 0,
    Graceful = 1,
    Force = 2,
};

// Shared by every task. The level only ever goes up.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    [[nodiscard]] CancelLevel level() const noexcept {
        return static_cast<CancelLevel>(level_.load(std::memory_order_acquire));
    }

    [[nodiscard]] bool isCancellationRequested() const noexcept {
        return level_.load(std::memory_order_acquire) >= static_cast<int>(CancelLevel::Graceful);
    }

    [[nodiscard]] bool isForceRequested() const noexcept {
        return level_.load(std::memory_order_acquire) >= static_cast<int>(CancelLevel::Force);
    }

    // Returns true if this call raised the level.
    bool raise(CancelLevel target) noexcept {
        const int wanted = static_cast<int>(target);
        int current = level_.load(std::memory_order_acquire);
        while (current < wanted) {
            if (level_.compare_exchange_weak(current, wanted, std::memory_order_acq_rel,
                                             std::memory_order_acquire)) {
                return true;
            }
        }
        return false;
    }

    bool requestGraceful() noexcept { return raise(CancelLevel::Graceful); }
    bool requestForce() noexcept { return raise(CancelLevel::Force); }

private:
    static_assert(std::atomic<int>::is_always_lock_free, "cancellation level must be lock-free");

    std::atomic<int> level_{static_cast<int>(CancelLevel::None)};
};

} // namespace parafetch
