#include "mpu/errors.hpp"

namespace mpu {

const char *to_string(AbortReason reason) noexcept {
    switch (reason) {
    case AbortReason::none:
        return "none";
    case AbortReason::paused:
        return "paused";
    case AbortReason::stalled:
        return "stalled";
    }
    return "unknown";
}

FileNotFoundError::FileNotFoundError(const std::filesystem::path &path)
    : Error("file not found " + path.string()), path_(path) {}

StorageError::StorageError(int status_code, const std::string &msg)
    : Error(msg), status_code_(status_code) {}

StreamAbortedError::StreamAbortedError(AbortReason reason, const std::string &msg)
    : Error(msg), reason_(reason) {}

std::string describe_error(std::exception_ptr error) {
    if (!error) {
        return "unknown error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const StorageError &err) {
        std::string message = err.what();
        if (message.empty()) {
            return "Server code = " + std::to_string(err.status_code());
        }
        return message;
    } catch (const std::exception &err) {
        std::string message = err.what();
        return message.empty() ? "unknown error" : message;
    } catch (...) {
        return "unknown error";
    }
}

} // namespace mpu
