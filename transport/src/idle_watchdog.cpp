#include "mpu/idle_watchdog.hpp"

#include <stdexcept>

namespace mpu {

IdleWatchdog::IdleWatchdog(std::chrono::milliseconds timeout, std::function<void()> on_expire)
    : timeout_(timeout), on_expire_(std::move(on_expire)) {
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("idle timeout must be > 0");
    }
    deadline_ = std::chrono::steady_clock::now() + timeout_;
    thread_ = std::thread(&IdleWatchdog::run, this);
}

IdleWatchdog::~IdleWatchdog() { stop(); }

void IdleWatchdog::kick() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_ || expired_) {
            return;
        }
        deadline_ = std::chrono::steady_clock::now() + timeout_;
    }
    cv_.notify_one();
}

void IdleWatchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool IdleWatchdog::expired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return expired_;
}

void IdleWatchdog::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        const auto deadline = deadline_;
        if (cv_.wait_until(lock, deadline, [&] { return stop_ || deadline_ != deadline; })) {
            continue;
        }
        expired_ = true;
        lock.unlock();
        if (on_expire_) {
            on_expire_();
        }
        return;
    }
}

} // namespace mpu
