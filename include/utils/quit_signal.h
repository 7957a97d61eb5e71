#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tap {

/// One-shot cancellation source. Tripped once by request(); every waiter
/// is released and stays released.
class QuitSignal {
public:
    QuitSignal() = default;
    QuitSignal(const QuitSignal&) = delete;
    QuitSignal& operator=(const QuitSignal&) = delete;

    void request() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            requested_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool requested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return requested_.load(std::memory_order_relaxed); });
    }

    /// Returns true if the signal was tripped before the timeout.
    template <typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        return cv_.wait_for(lock, timeout,
                            [this] { return requested_.load(std::memory_order_relaxed); });
    }

private:
    std::mutex mu_;
    std::condition_variable cv_;
    std::atomic<bool> requested_{false};
};

} // namespace tap
