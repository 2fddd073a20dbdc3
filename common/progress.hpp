#pragma once

// ============================================================
// progress.hpp -- Periodic throughput/ETA reporting for one transfer
// ============================================================

#include "platform.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

struct ProgressSample {
    u64    done{0};
    u64    total{0};
    double percent{0.0};     // clamped to [0, 100]
    double elapsed_s{0.0};
    double speed{0.0};       // bytes per second
    double eta_s{-1.0};      // negative while throughput is zero
};

class ProgressTracker {
public:
    using Sink = std::function<void(const std::string&)>;

    ProgressTracker(u64 total, std::chrono::milliseconds interval, Sink sink);
    ~ProgressTracker();

    ProgressTracker(const ProgressTracker&) = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    // Start the background reporting thread
    void start();

    // Called from the copy loop
    void add(u64 n) { done_.fetch_add(n, std::memory_order_relaxed); }

    ProgressSample sample() const;

    // Stop reporting; joins the thread. Safe to call twice.
    void stop();

    static std::string format(const ProgressSample& s);

private:
    u64 total_;
    std::chrono::milliseconds interval_;
    Sink sink_;
    std::atomic<u64> done_{0};
    std::chrono::steady_clock::time_point started_;

    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
};
