#pragma once

#include "mpu/cancellation.hpp"
#include "mpu/file_source.hpp"
#include "mpu/idle_watchdog.hpp"
#include "mpu/part_planner.hpp"
#include "mpu/storage_client.hpp"
#include "mpu/transport_events.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mpu {

enum class TransportState { idle, checking, uploading, completing, finished, paused, errored };

const char *to_string(TransportState state) noexcept;

struct TransportConfig {
    std::string session_id;
    std::string bucket;
    std::string object_key;
    std::filesystem::path local_path;
    std::optional<std::string> upload_id;
    std::uint64_t part_size_bytes = kDefaultPartSize;
    std::chrono::milliseconds idle_timeout = kDefaultIdleTimeout;
};

// Resumable multipart upload of one local file. One part is in flight at a
// time; pause() may be called from any thread. Results are reported through
// the listener, at most one terminal event (finish, pause or error) per start().
class ResumableTransport {
  public:
    ResumableTransport(TransportConfig config, StorageClient &client, FileSource &files,
                       TransportListener &listener);

    ResumableTransport(const ResumableTransport &) = delete;
    ResumableTransport &operator=(const ResumableTransport &) = delete;

    // Runs the whole upload on the calling thread.
    void start();

    // Uploads `parts` in order on the calling thread. Throws on the first part
    // that fails; parts after it are not attempted.
    void resume(const std::vector<PartDescriptor> &parts);

    void pause();

    bool check_consistency();

    std::optional<std::string> content_md5();

    bool is_paused() const;

    TransportState state() const;

    std::uint64_t uploaded_bytes() const;

    std::optional<std::string> upload_id() const;

    const std::string &session_id() const noexcept { return config_.session_id; }

  private:
    void run(const std::shared_ptr<CancellationToken> &token);
    void drive(const std::vector<PartDescriptor> &parts,
               const std::shared_ptr<CancellationToken> &token);
    void upload_part(const PartDescriptor &part, const std::shared_ptr<CancellationToken> &token);
    void end_stream();
    bool check_consistency(const FileStat &file, const CancellationToken *token);
    std::optional<std::string> content_md5(const FileStat &file, const CancellationToken *token);
    void complete_upload(const CancellationToken &token);

    std::shared_ptr<CancellationToken> begin_run();
    void end_run();
    void set_state(TransportState state);
    void finish();
    void fail(std::exception_ptr error);

    TransportConfig config_;
    StorageClient &client_;
    FileSource &files_;
    TransportListener &listener_;
    PartPlanner planner_;

    mutable std::mutex mutex_;
    TransportState state_{TransportState::idle};
    std::optional<std::string> upload_id_;
    std::uint64_t uploaded_bytes_{0};
    std::optional<std::string> md5_;
    bool paused_{true};
    bool running_{false};
    bool streaming_{false};
    bool terminal_sent_{false};
    std::shared_ptr<CancellationToken> token_;
    std::shared_ptr<CancellationToken> part_token_;
};

} // namespace mpu
