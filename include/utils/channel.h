#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace tap {

/// Unbounded MPMC queue with close semantics. push() never blocks; pop()
/// blocks until an item arrives or the channel is closed and drained.
template <typename T>
class UnboundedChannel {
public:
    UnboundedChannel() = default;

    // Non-copyable, non-movable (contains a mutex)
    UnboundedChannel(const UnboundedChannel&) = delete;
    UnboundedChannel& operator=(const UnboundedChannel&) = delete;

    /// Returns false (and drops the item) once the channel is closed.
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mu_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    [[nodiscard]] std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        return take_locked();
    }

    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        cv_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); });
        return take_locked();
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mu_);
        return take_locked();
    }

    /// Idempotent. Items already queued remain poppable.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mu_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return items_.size();
    }

private:
    std::optional<T> take_locked() {
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace tap
