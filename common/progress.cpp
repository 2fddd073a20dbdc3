// ============================================================
// progress.cpp -- ProgressTracker implementation
// ============================================================

#include "progress.hpp"
#include "utils.hpp"
#include <algorithm>
#include <sstream>

ProgressTracker::ProgressTracker(u64 total, std::chrono::milliseconds interval, Sink sink)
    : total_(total)
    , interval_(interval)
    , sink_(std::move(sink))
    , started_(std::chrono::steady_clock::now())
{}

ProgressTracker::~ProgressTracker() {
    stop();
}

void ProgressTracker::start() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (running_) return;
        running_ = true;
    }
    thread_ = std::thread([this] {
        std::unique_lock<std::mutex> lk(mutex_);
        while (running_) {
            if (cv_.wait_for(lk, interval_, [this] { return !running_; })) break;
            lk.unlock();
            if (sink_) sink_(format(sample()));
            lk.lock();
        }
    });
}

void ProgressTracker::stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

ProgressSample ProgressTracker::sample() const {
    ProgressSample s;
    s.done  = done_.load(std::memory_order_relaxed);
    s.total = total_;
    s.elapsed_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started_).count();

    if (total_ == 0) {
        s.percent = 100.0;
    } else {
        s.percent = std::clamp((double)s.done / (double)total_ * 100.0, 0.0, 100.0);
    }

    s.speed = s.elapsed_s > 0 ? (double)s.done / s.elapsed_s : 0.0;
    if (s.speed > 0) {
        u64 remaining = s.done < total_ ? total_ - s.done : 0;
        s.eta_s = (double)remaining / s.speed;
    }
    return s;
}

std::string ProgressTracker::format(const ProgressSample& s) {
    std::ostringstream ss;
    ss << utils::format_percent(s.percent)
       << "  " << utils::format_bytes(s.done) << "/" << utils::format_bytes(s.total)
       << "  elapsed " << utils::format_duration_s((u64)s.elapsed_s)
       << "  " << utils::format_speed(s.speed)
       << "  ETA " << utils::format_eta(s.eta_s);
    return ss.str();
}
