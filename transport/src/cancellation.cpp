#include "mpu/cancellation.hpp"

namespace mpu {

bool CancellationToken::cancel(AbortReason reason) noexcept {
    if (reason == AbortReason::none) {
        return false;
    }
    AbortReason expected = AbortReason::none;
    return reason_.compare_exchange_strong(expected, reason);
}

bool CancellationToken::cancelled() const noexcept { return reason() != AbortReason::none; }

AbortReason CancellationToken::reason() const noexcept { return reason_.load(); }

void CancellationToken::throw_if_cancelled() const {
    const AbortReason current = reason();
    if (current != AbortReason::none) {
        throw StreamAbortedError(current, std::string("stream aborted: ") + to_string(current));
    }
}

} // namespace mpu
