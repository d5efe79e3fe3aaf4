#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

namespace fraudscope {

/// Cooperative stop flag shared between a caller and a long-running search.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

/// Wall-clock and cancellation budget for search operations.
/// Tracks elapsed time and the number of single-source expansions.
/// Safe to query and update from several worker threads.
class SearchBudget {
public:
    /// max_seconds <= 0 means no time limit. token may be null.
    SearchBudget(double max_seconds, CancellationTokenPtr token)
        : max_seconds_(max_seconds), token_(std::move(token)) {}

    void start() {
        start_time_ = std::chrono::steady_clock::now();
        expansions_.store(0);
    }

    void recordExpansion() { expansions_.fetch_add(1, std::memory_order_relaxed); }

    bool canContinue() const { return !isCancelled() && !isTimeExhausted(); }

    double elapsedSeconds() const {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration<double>(now - start_time_).count();
    }

    int expansions() const { return expansions_.load(); }
    bool isCancelled() const { return token_ && token_->isCancelled(); }
    bool isTimeExhausted() const { return max_seconds_ > 0.0 && elapsedSeconds() >= max_seconds_; }

private:
    double max_seconds_;
    CancellationTokenPtr token_;
    std::atomic<int> expansions_{0};
    std::chrono::steady_clock::time_point start_time_ = std::chrono::steady_clock::now();
};

} // namespace fraudscope
