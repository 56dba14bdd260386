#include "mpu/event_log.hpp"

#include <cstdint>
#include <iomanip>
#include <sstream>

namespace mpu {

std::string json_quote(const std::string &value) {
    std::ostringstream oss;
    oss << '"';
    for (const char c : value) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<unsigned int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
        }
    }
    oss << '"';
    return oss.str();
}

std::string format_event(const StartEvent &event) {
    return "start => {\"uuid\":" + json_quote(event.session_id) +
           ",\"uploadId\":" + json_quote(event.upload_id) +
           ",\"localPath\":" + json_quote(event.local_path.string()) + "}";
}

std::string format_event(const ProgressEvent &event) {
    std::ostringstream oss;
    oss << "progress => {\"uuid\":" << json_quote(event.session_id)
        << ",\"rate\":" << static_cast<std::uint64_t>(event.rate)
        << ",\"bytesWritten\":" << event.bytes_written << "}";
    return oss.str();
}

std::string format_event(const PauseEvent &event) {
    return "pause => {\"uuid\":" + json_quote(event.session_id) + "}";
}

std::string format_event(const FinishEvent &event) {
    return "finish => {\"uuid\":" + json_quote(event.session_id) +
           ",\"localPath\":" + json_quote(event.local_path.string()) + "}";
}

std::string format_event(const ErrorEvent &event) {
    return "error => {\"uuid\":" + json_quote(event.session_id) +
           ",\"error\":" + json_quote(event.error) + "}";
}

} // namespace mpu
