#include "health_monitor.hpp"
#include <spdlog/spdlog.h>
#include <exception>

HealthMonitor::HealthMonitor(Sweep sweep, std::chrono::milliseconds interval, std::chrono::milliseconds error_delay,
                             Interrupt interrupt)
    : sweep_(std::move(sweep)),
      interrupt_(std::move(interrupt)),
      interval_(interval),
      error_delay_(error_delay) {
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_) {
        spdlog::warn("Health monitoring already running");
        return;
    }

    // A previous loop may have been stopped without being joined
    if (thread_.joinable()) {
        thread_.join();
    }

    running_ = true;
    thread_ = std::thread([this]() {
        run_loop();
    });

    spdlog::info("Started continuous health monitoring (interval {} ms)", interval_.count());
}

void HealthMonitor::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        if (!running_.exchange(false) && !thread_.joinable()) {
            return;
        }
    }
    wake_cv_.notify_all();

    if (interrupt_) {
        interrupt_();
    }

    if (thread_.joinable()) {
        thread_.join();
    }

    spdlog::info("Stopped health monitoring");
}

bool HealthMonitor::is_running() const {
    return running_;
}

void HealthMonitor::run_loop() {
    while (running_) {
        std::chrono::milliseconds delay = interval_;

        try {
            sweep_();
            completed_sweeps_++;
        } catch (const std::exception& e) {
            failed_sweeps_++;
            spdlog::error("Error in health monitor loop: {}", e.what());
            delay = error_delay_;
        } catch (...) {
            failed_sweeps_++;
            spdlog::error("Error in health monitor loop: unknown error");
            delay = error_delay_;
        }

        if (!sleep_for(delay)) {
            break;
        }
    }
    spdlog::debug("Health monitor loop finished");
}

bool HealthMonitor::sleep_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wake_mutex_);
    return !wake_cv_.wait_for(lock, delay, [this]() { return !running_; });
}
