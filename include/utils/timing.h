#pragma once
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

namespace tap {

/// Wall-clock stopwatch that reports "<label> took: X ms".
class Timing {
public:
    using Clock = std::chrono::steady_clock;

    explicit Timing(std::string label) : label_(std::move(label)), start_(Clock::now()) {}

    void stop() {
        stop_ = Clock::now();
        stopped_ = true;
    }

    [[nodiscard]] double elapsed_ms() const {
        auto end = stopped_ ? stop_ : Clock::now();
        return std::chrono::duration<double, std::milli>(end - start_).count();
    }

    /// Stops the clock if still running, then logs the elapsed time.
    void print(std::ostream& os = std::cout) {
        if (!stopped_) stop();
        os << label_ << " took: " << std::fixed << std::setprecision(3)
           << elapsed_ms() << " ms\n" << std::flush;
    }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }

private:
    std::string label_;
    Clock::time_point start_;
    Clock::time_point stop_{};
    bool stopped_ = false;
};

} // namespace tap
