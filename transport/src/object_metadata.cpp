#include "mpu/object_metadata.hpp"

#include "mpu/errors.hpp"

#include <stdexcept>

namespace mpu {

namespace {

template <typename T, typename Parse>
T parse_number(const std::string &name, const std::string &value, Parse parse) {
    std::size_t consumed = 0;
    T result{};
    try {
        result = static_cast<T>(parse(value, &consumed));
    } catch (const std::logic_error &) {
        throw Error("malformed " + name + " header: '" + value + "'");
    }
    if (consumed != value.size()) {
        throw Error("malformed " + name + " header: '" + value + "'");
    }
    return result;
}

std::uint64_t parse_unsigned(const std::string &name, const std::string &value) {
    if (!value.empty() && value.front() == '-') {
        throw Error("malformed " + name + " header: '" + value + "'");
    }
    return parse_number<std::uint64_t>(
        name, value, [](const std::string &s, std::size_t *pos) { return std::stoull(s, pos); });
}

std::int64_t parse_signed(const std::string &name, const std::string &value) {
    return parse_number<std::int64_t>(
        name, value, [](const std::string &s, std::size_t *pos) { return std::stoll(s, pos); });
}

} // namespace

ObjectMetadata parse_object_metadata(const Headers &response_headers) {
    auto length = response_headers.find(headers::kContentLength);
    if (length == response_headers.end()) {
        throw Error("object metadata lacks a content-length header");
    }
    ObjectMetadata metadata{};
    metadata.content_length = parse_unsigned(headers::kContentLength, length->second);

    auto origin = response_headers.find(headers::kMetaFrom);
    if (origin != response_headers.end()) {
        metadata.origin = origin->second;
    }
    auto mtime = response_headers.find(headers::kMetaModifiedTime);
    if (mtime != response_headers.end() && !mtime->second.empty()) {
        metadata.modified_time_ms = parse_signed(headers::kMetaModifiedTime, mtime->second);
    }
    auto md5 = response_headers.find(headers::kMetaMd5);
    if (md5 != response_headers.end() && !md5->second.empty()) {
        metadata.md5 = md5->second;
    }
    return metadata;
}

Headers make_completion_metadata(std::int64_t modified_time_ms,
                                 const std::optional<std::string> &md5) {
    Headers metadata;
    metadata[headers::kMetaFrom] = headers::kTransportOrigin;
    metadata[headers::kMetaModifiedTime] = std::to_string(modified_time_ms);
    if (md5) {
        metadata[headers::kMetaMd5] = *md5;
    }
    return metadata;
}

} // namespace mpu
