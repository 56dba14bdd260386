#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace mpu {

struct StartEvent {
    std::string session_id;
    std::string upload_id;
    std::filesystem::path local_path;
};

struct ProgressEvent {
    std::string session_id;
    double rate;
    std::uint64_t bytes_written;
};

struct PauseEvent {
    std::string session_id;
};

struct FinishEvent {
    std::string session_id;
    std::filesystem::path local_path;
};

struct ErrorEvent {
    std::string session_id;
    std::string error;
};

// Lifecycle notifications of a ResumableTransport. Callbacks run on the thread
// driving the upload, or on the caller of pause().
class TransportListener {
  public:
    virtual ~TransportListener() = default;

    virtual void on_start(const StartEvent &) {}
    virtual void on_progress(const ProgressEvent &) {}
    virtual void on_pause(const PauseEvent &) {}
    virtual void on_finish(const FinishEvent &) {}
    virtual void on_error(const ErrorEvent &) {}
};

} // namespace mpu
