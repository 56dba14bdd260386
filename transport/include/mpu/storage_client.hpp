#pragma once

#include "mpu/part_body.hpp"
#include "mpu/part_planner.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mpu {

struct HeaderNameLess {
    bool operator()(const std::string &lhs, const std::string &rhs) const;
};

// HTTP-style headers; names compare case-insensitively.
using Headers = std::map<std::string, std::string, HeaderNameLess>;

struct PartListing {
    std::vector<UploadedPart> parts;
    std::uint32_t max_parts;
};

struct PartParams {
    std::uint32_t part_number;
    std::string upload_id;
};

// Remote multipart object storage. Failures are reported as StorageError; a
// missing object or session uses status 404.
class StorageClient {
  public:
    virtual ~StorageClient() = default;

    virtual std::string initiate_multipart_upload(const std::string &bucket,
                                                  const std::string &key) = 0;

    virtual PartListing list_parts(const std::string &bucket, const std::string &key,
                                   const std::string &upload_id) = 0;

    virtual void upload_part(const std::string &bucket, const std::string &key, PartBody &body,
                             const Headers &headers, const PartParams &params) = 0;

    virtual void complete_multipart_upload(const std::string &bucket, const std::string &key,
                                           const std::string &upload_id,
                                           const std::vector<UploadedPart> &parts,
                                           const Headers &metadata) = 0;

    virtual Headers get_object_metadata(const std::string &bucket, const std::string &key) = 0;
};

} // namespace mpu
