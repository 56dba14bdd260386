#pragma once

#include "mpu/errors.hpp"

#include <atomic>

namespace mpu {

// Shared between the upload driver, pause() callers and the idle watchdog.
// The first reason recorded sticks.
class CancellationToken {
  public:
    bool cancel(AbortReason reason) noexcept;

    bool cancelled() const noexcept;

    AbortReason reason() const noexcept;

    void throw_if_cancelled() const;

  private:
    std::atomic<AbortReason> reason_{AbortReason::none};
};

} // namespace mpu
