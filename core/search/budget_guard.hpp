#pragma once

#include <atomic>
#include <chrono>

namespace numseek {

/// Guards the wall-clock budget of one search run.
/// Polled at every loop boundary of the enumeration. Once it fires it
/// stays fired, so every loop unwinds on its next poll.
class BudgetGuard {
public:
    explicit BudgetGuard(double max_seconds,
                         const std::atomic<bool>* stop_flag = nullptr)
        : max_seconds_(max_seconds), stop_flag_(stop_flag) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        fired_ = false;
    }

    bool canContinue() {
        if (fired_) return false;
        if (stopRequested() || isTimeExhausted()) fired_ = true;
        return !fired_;
    }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    bool fired() const { return fired_; }
    bool isTimeExhausted() const { return elapsedSeconds() > max_seconds_; }

    bool stopRequested() const {
        return stop_flag_ && stop_flag_->load(std::memory_order_relaxed);
    }

private:
    double max_seconds_;
    const std::atomic<bool>* stop_flag_;
    bool fired_ = false;
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace numseek
