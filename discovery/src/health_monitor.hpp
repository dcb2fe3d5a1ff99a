#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

// Background loop that runs one health sweep per interval.
//
// A sweep that throws is logged and retried after `error_delay` instead of
// `interval`; it never ends the loop. stop() calls `interrupt` after waking
// the loop so a sweep in progress can be cut short before the join.
class HealthMonitor {
public:
    using Sweep = std::function<void()>;
    using Interrupt = std::function<void()>;

    HealthMonitor(Sweep sweep, std::chrono::milliseconds interval, std::chrono::milliseconds error_delay,
                  Interrupt interrupt = {});
    ~HealthMonitor();

    void start();
    void stop();
    bool is_running() const;

    std::uint64_t completed_sweeps() const { return completed_sweeps_; }
    std::uint64_t failed_sweeps() const { return failed_sweeps_; }

    // Non-copyable
    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

private:
    void run_loop();
    // Returns false when woken by stop().
    bool sleep_for(std::chrono::milliseconds delay);

    Sweep sweep_;
    Interrupt interrupt_;
    std::chrono::milliseconds interval_;
    std::chrono::milliseconds error_delay_;

    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> completed_sweeps_{0};
    std::atomic<std::uint64_t> failed_sweeps_{0};

    std::mutex lifecycle_mutex_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
    std::thread thread_;
};
