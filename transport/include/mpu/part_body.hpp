#pragma once

#include "mpu/cancellation.hpp"
#include "mpu/file_source.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace mpu {

struct PartProgress {
    double rate;                 // bytes per second since the part was opened
    std::uint64_t bytes_written; // bytes of this part handed to the client so far
};

// Request body for one part upload. Storage clients pull the payload through
// read(); a cancelled token surfaces as StreamAbortedError on the next read.
// Clients that block outside read() should poll aborted().
class PartBody {
  public:
    using ProgressCallback = std::function<void(const PartProgress &)>;

    PartBody(std::unique_ptr<ByteRangeStream> source,
             std::shared_ptr<const CancellationToken> token, ProgressCallback on_progress);

    std::size_t read(char *buffer, std::size_t size);

    bool aborted() const noexcept;

    AbortReason abort_reason() const noexcept;

    std::uint64_t length() const noexcept;

    std::uint64_t bytes_written() const noexcept { return bytes_written_; }

  private:
    std::unique_ptr<ByteRangeStream> source_;
    std::shared_ptr<const CancellationToken> token_;
    ProgressCallback on_progress_;
    std::chrono::steady_clock::time_point opened_at_;
    std::uint64_t bytes_written_{0};
};

} // namespace mpu
