#include "mpu/resumable_transport.hpp"

#include "mpu/content_hash.hpp"
#include "mpu/object_metadata.hpp"

#include <algorithm>
#include <iostream>
#include <queue>
#include <sstream>
#include <stdexcept>

namespace mpu {

namespace {

constexpr std::size_t kHashBufferSize = 1u << 20;

} // namespace

const char *to_string(TransportState state) noexcept {
    switch (state) {
    case TransportState::idle:
        return "idle";
    case TransportState::checking:
        return "checking";
    case TransportState::uploading:
        return "uploading";
    case TransportState::completing:
        return "completing";
    case TransportState::finished:
        return "finished";
    case TransportState::paused:
        return "paused";
    case TransportState::errored:
        return "errored";
    }
    return "unknown";
}

ResumableTransport::ResumableTransport(TransportConfig config, StorageClient &client,
                                       FileSource &files, TransportListener &listener)
    : config_(std::move(config)), client_(client), files_(files), listener_(listener),
      planner_(config_.part_size_bytes), upload_id_(config_.upload_id) {
    if (config_.bucket.empty() || config_.object_key.empty()) {
        throw std::invalid_argument("bucket and object key must not be empty");
    }
    if (config_.idle_timeout.count() <= 0) {
        throw std::invalid_argument("idle timeout must be > 0");
    }
    if (upload_id_ && upload_id_->empty()) {
        upload_id_.reset();
    }
}

void ResumableTransport::start() {
    std::shared_ptr<CancellationToken> token;
    try {
        token = begin_run();
    } catch (const Error &err) {
        std::cerr << "Ignoring start for session " << config_.session_id << ": " << err.what()
                  << std::endl;
        return;
    }
    try {
        if (!files_.exists(config_.local_path)) {
            throw FileNotFoundError(config_.local_path);
        }
        set_state(TransportState::checking);
        run(token);
    } catch (...) {
        fail(std::current_exception());
    }
    end_run();
}

void ResumableTransport::resume(const std::vector<PartDescriptor> &parts) {
    auto token = begin_run();
    try {
        if (!upload_id()) {
            throw Error("no upload session to resume for session " + config_.session_id);
        }
        drive(parts, token);
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = (paused_ || token->reason() == AbortReason::paused) ? TransportState::paused
                                                                         : TransportState::errored;
            paused_ = true;
        }
        end_run();
        throw;
    }
    end_run();
}

void ResumableTransport::pause() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_ = true;
        if (token_) {
            token_->cancel(AbortReason::paused);
        }
        if (part_token_) {
            part_token_->cancel(AbortReason::paused);
        }
        // The aborted stream reports the pause through the failure path.
        if (streaming_) {
            return;
        }
        if (running_) {
            if (terminal_sent_) {
                return;
            }
            terminal_sent_ = true;
        } else if (state_ == TransportState::finished || state_ == TransportState::errored) {
            return;
        }
        state_ = TransportState::paused;
    }
    listener_.on_pause(PauseEvent{config_.session_id});
}

bool ResumableTransport::check_consistency() {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = token_;
    }
    return check_consistency(files_.stat(config_.local_path), token.get());
}

std::optional<std::string> ResumableTransport::content_md5() {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = token_;
    }
    return content_md5(files_.stat(config_.local_path), token.get());
}

bool ResumableTransport::is_paused() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paused_;
}

TransportState ResumableTransport::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint64_t ResumableTransport::uploaded_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return uploaded_bytes_;
}

std::optional<std::string> ResumableTransport::upload_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return upload_id_;
}

void ResumableTransport::run(const std::shared_ptr<CancellationToken> &token) {
    const auto file = files_.stat(config_.local_path);

    // A held session id means an earlier run already decided to upload.
    if (!upload_id()) {
        if (check_consistency(file, token.get())) {
            finish();
            return;
        }
        token->throw_if_cancelled();
        auto id = client_.initiate_multipart_upload(config_.bucket, config_.object_key);
        if (id.empty()) {
            throw StorageError(0, "remote returned an empty upload id");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (!upload_id_) {
            upload_id_ = std::move(id);
        }
    }

    token->throw_if_cancelled();
    const auto id = *upload_id();
    auto listing = client_.list_parts(config_.bucket, config_.object_key, id);
    const auto accepted = PartPlanner::order_parts(std::move(listing.parts));
    const auto committed = PartPlanner::committed_bytes(accepted);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uploaded_bytes_ = committed;
    }
    const auto remaining = planner_.decompose(accepted, listing.max_parts, committed, file.size);
    if (!remaining.empty()) {
        token->throw_if_cancelled();
        listener_.on_start(StartEvent{config_.session_id, id, config_.local_path});
        drive(remaining, token);
    }
    complete_upload(*token);
    finish();
}

void ResumableTransport::drive(const std::vector<PartDescriptor> &parts,
                               const std::shared_ptr<CancellationToken> &token) {
    set_state(TransportState::uploading);
    std::queue<PartDescriptor> queue;
    for (const auto &part : parts) {
        queue.push(part);
    }
    while (!queue.empty()) {
        const auto part = queue.front();
        queue.pop();
        upload_part(part, token);
    }
}

void ResumableTransport::upload_part(const PartDescriptor &part,
                                     const std::shared_ptr<CancellationToken> &token) {
    token->throw_if_cancelled();
    auto source = files_.open_range(config_.local_path, part.offset, part.size);
    const auto base = uploaded_bytes();

    // A stall aborts this part only; the run token carries pauses.
    auto part_token = std::make_shared<CancellationToken>();
    IdleWatchdog watchdog(config_.idle_timeout,
                          [part_token] { part_token->cancel(AbortReason::stalled); });
    PartBody body(std::move(source), part_token, [&](const PartProgress &progress) {
        // Once the body is drained only the acknowledgement is outstanding.
        if (progress.bytes_written >= part.size) {
            watchdog.stop();
        } else {
            watchdog.kick();
        }
        listener_.on_progress(
            ProgressEvent{config_.session_id, progress.rate, base + progress.bytes_written});
    });

    Headers request_headers;
    request_headers[headers::kContentLength] = std::to_string(part.size);
    request_headers[headers::kContentType] = headers::kOctetStream;
    const PartParams params{part.part_number, *upload_id()};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        streaming_ = true;
        part_token_ = part_token;
        if (token->cancelled()) {
            part_token->cancel(token->reason());
        }
    }
    try {
        client_.upload_part(config_.bucket, config_.object_key, body, request_headers, params);
    } catch (const StreamAbortedError &err) {
        end_stream();
        if (err.reason() == AbortReason::stalled) {
            std::ostringstream oss;
            oss << "upload stalled: no progress for " << config_.idle_timeout.count()
                << " ms on part " << part.part_number;
            throw StreamAbortedError(AbortReason::stalled, oss.str());
        }
        throw;
    } catch (...) {
        end_stream();
        std::cerr << "Failed to upload part " << part.part_number << " of "
                  << config_.local_path << std::endl;
        throw;
    }
    watchdog.stop();
    end_stream();

    std::lock_guard<std::mutex> lock(mutex_);
    uploaded_bytes_ += part.size;
}

void ResumableTransport::end_stream() {
    std::lock_guard<std::mutex> lock(mutex_);
    streaming_ = false;
    part_token_.reset();
}

bool ResumableTransport::check_consistency(const FileStat &file, const CancellationToken *token) {
    if (token) {
        token->throw_if_cancelled();
    }
    std::optional<ObjectMetadata> remote;
    try {
        remote = parse_object_metadata(
            client_.get_object_metadata(config_.bucket, config_.object_key));
    } catch (const StorageError &err) {
        if (err.is_not_found()) {
            return false;
        }
        throw;
    }

    if (remote->content_length != file.size) {
        return false;
    }
    // Objects uploaded by other means are trusted on size alone.
    if (!remote->from_transport()) {
        return true;
    }
    if (remote->md5 && ContentHash::hashable(file.size)) {
        const auto local = content_md5(file, token);
        return local && *local == *remote->md5;
    }
    return remote->modified_time_ms && *remote->modified_time_ms == file.modified_time_ms;
}

std::optional<std::string> ResumableTransport::content_md5(const FileStat &file,
                                                           const CancellationToken *token) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (md5_) {
            return md5_;
        }
    }
    if (!ContentHash::hashable(file.size)) {
        return std::nullopt;
    }
    auto stream = files_.open_range(config_.local_path, 0, file.size);
    ContentHash::Md5Accumulator accumulator;
    std::vector<char> buffer(static_cast<std::size_t>(
        std::min<std::uint64_t>(std::max<std::uint64_t>(file.size, 1), kHashBufferSize)));
    while (true) {
        if (token) {
            token->throw_if_cancelled();
        }
        const auto read = stream->read(buffer.data(), buffer.size());
        if (read == 0) {
            break;
        }
        accumulator.update(buffer.data(), read);
    }
    auto digest = accumulator.base64();

    std::lock_guard<std::mutex> lock(mutex_);
    md5_ = digest;
    return md5_;
}

void ResumableTransport::complete_upload(const CancellationToken &token) {
    token.throw_if_cancelled();
    set_state(TransportState::completing);
    const auto id = *upload_id();
    auto listing = client_.list_parts(config_.bucket, config_.object_key, id);
    const auto ordered = PartPlanner::order_parts(std::move(listing.parts));
    const auto file = files_.stat(config_.local_path);
    const auto md5 = content_md5(file, &token);
    token.throw_if_cancelled();
    client_.complete_multipart_upload(config_.bucket, config_.object_key, id, ordered,
                                      make_completion_metadata(file.modified_time_ms, md5));
}

std::shared_ptr<CancellationToken> ResumableTransport::begin_run() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        throw Error("upload already running for session " + config_.session_id);
    }
    running_ = true;
    paused_ = false;
    streaming_ = false;
    terminal_sent_ = false;
    token_ = std::make_shared<CancellationToken>();
    return token_;
}

void ResumableTransport::end_run() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    streaming_ = false;
    token_.reset();
    part_token_.reset();
}

void ResumableTransport::set_state(TransportState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}

void ResumableTransport::finish() {
    bool paused = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_sent_) {
            return;
        }
        terminal_sent_ = true;
        paused = paused_;
        paused_ = true;
        state_ = paused ? TransportState::paused : TransportState::finished;
    }
    if (paused) {
        listener_.on_pause(PauseEvent{config_.session_id});
        return;
    }
    listener_.on_finish(FinishEvent{config_.session_id, config_.local_path});
}

void ResumableTransport::fail(std::exception_ptr error) {
    const auto message = describe_error(error);
    bool paused = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminal_sent_) {
            return;
        }
        terminal_sent_ = true;
        paused = paused_ || (token_ && token_->reason() == AbortReason::paused);
        paused_ = true;
        state_ = paused ? TransportState::paused : TransportState::errored;
    }
    if (paused) {
        listener_.on_pause(PauseEvent{config_.session_id});
        return;
    }
    std::cerr << "Upload failed for session " << config_.session_id << ": " << message
              << std::endl;
    listener_.on_error(ErrorEvent{config_.session_id, message});
}

} // namespace mpu
