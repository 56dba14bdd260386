#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace mpu {

constexpr std::chrono::milliseconds kDefaultIdleTimeout{10000};

// Deadman switch: runs on_expire once if kick() is not called within timeout.
class IdleWatchdog {
  public:
    IdleWatchdog(std::chrono::milliseconds timeout, std::function<void()> on_expire);
    ~IdleWatchdog();

    IdleWatchdog(const IdleWatchdog &) = delete;
    IdleWatchdog &operator=(const IdleWatchdog &) = delete;

    void kick();

    void stop();

    bool expired() const;

  private:
    void run();

    std::chrono::milliseconds timeout_;
    std::function<void()> on_expire_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::chrono::steady_clock::time_point deadline_;
    bool stop_{false};
    bool expired_{false};
    std::thread thread_;
};

} // namespace mpu
