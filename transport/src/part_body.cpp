#include "mpu/part_body.hpp"

#include <stdexcept>

namespace mpu {

PartBody::PartBody(std::unique_ptr<ByteRangeStream> source,
                   std::shared_ptr<const CancellationToken> token, ProgressCallback on_progress)
    : source_(std::move(source)), token_(std::move(token)), on_progress_(std::move(on_progress)),
      opened_at_(std::chrono::steady_clock::now()) {
    if (!source_) {
        throw std::invalid_argument("part body requires a source stream");
    }
    if (!token_) {
        throw std::invalid_argument("part body requires a cancellation token");
    }
}

std::size_t PartBody::read(char *buffer, std::size_t size) {
    token_->throw_if_cancelled();
    const auto read = source_->read(buffer, size);
    if (read == 0) {
        return 0;
    }
    bytes_written_ += read;
    if (on_progress_) {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - opened_at_;
        const double seconds = elapsed.count();
        const double rate = seconds > 0 ? static_cast<double>(bytes_written_) / seconds : 0.0;
        on_progress_(PartProgress{rate, bytes_written_});
    }
    return read;
}

bool PartBody::aborted() const noexcept { return token_->cancelled(); }

AbortReason PartBody::abort_reason() const noexcept { return token_->reason(); }

std::uint64_t PartBody::length() const noexcept { return source_->length(); }

} // namespace mpu
