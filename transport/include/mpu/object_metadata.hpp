#pragma once

#include "mpu/storage_client.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mpu {

namespace headers {

inline constexpr char kContentLength[] = "Content-Length";
inline constexpr char kContentType[] = "Content-Type";
inline constexpr char kOctetStream[] = "application/octet-stream";

inline constexpr char kMetaFrom[] = "x-bce-meta-from";
inline constexpr char kMetaModifiedTime[] = "x-bce-meta-mtime";
// Base64 MD5 of the whole file, as the BOS SDK's md5stream() produces it. Objects
// tagged by other BOS clients only compare equal in this encoding.
inline constexpr char kMetaMd5[] = "x-bce-meta-md5";

// Origin tag written on every object this transport completes.
inline constexpr char kTransportOrigin[] = "bce-client";

} // namespace headers

struct ObjectMetadata {
    std::uint64_t content_length;
    std::optional<std::string> origin;
    std::optional<std::int64_t> modified_time_ms;
    std::optional<std::string> md5;

    bool from_transport() const { return origin && *origin == headers::kTransportOrigin; }
};

ObjectMetadata parse_object_metadata(const Headers &response_headers);

Headers make_completion_metadata(std::int64_t modified_time_ms,
                                 const std::optional<std::string> &md5);

} // namespace mpu
