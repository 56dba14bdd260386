#pragma once

#include <exception>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace mpu {

enum class AbortReason { none, paused, stalled };

const char *to_string(AbortReason reason) noexcept;

class Error : public std::runtime_error {
  public:
    explicit Error(const std::string &msg) : std::runtime_error(msg) {}
};

class FileNotFoundError : public Error {
  public:
    explicit FileNotFoundError(const std::filesystem::path &path);

    const std::filesystem::path &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

// Failure reported by the remote storage service. A status code of 0 means the
// request never produced a response.
class StorageError : public Error {
  public:
    StorageError(int status_code, const std::string &msg);

    int status_code() const noexcept { return status_code_; }

    bool is_not_found() const noexcept { return status_code_ == 404; }

  private:
    int status_code_;
};

class StreamAbortedError : public Error {
  public:
    StreamAbortedError(AbortReason reason, const std::string &msg);

    AbortReason reason() const noexcept { return reason_; }

  private:
    AbortReason reason_;
};

// Message reported to listeners for an arbitrary failure.
std::string describe_error(std::exception_ptr error);

} // namespace mpu
