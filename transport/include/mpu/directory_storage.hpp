#pragma once

#include "mpu/storage_client.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace mpu {

struct DirectoryStorageConfig {
    std::filesystem::path root;
    std::uint32_t max_parts = 10000;
};

// Multipart object store over a local directory tree:
//   <root>/<bucket>/<key>              completed object
//   <root>/<bucket>/<key>.meta         "name: value" metadata lines
//   <root>/.uploads/<id>/part-<n>      accepted parts of an open session
class DirectoryStorageClient : public StorageClient {
  public:
    explicit DirectoryStorageClient(DirectoryStorageConfig config);

    std::string initiate_multipart_upload(const std::string &bucket,
                                          const std::string &key) override;

    PartListing list_parts(const std::string &bucket, const std::string &key,
                           const std::string &upload_id) override;

    void upload_part(const std::string &bucket, const std::string &key, PartBody &body,
                     const Headers &headers, const PartParams &params) override;

    void complete_multipart_upload(const std::string &bucket, const std::string &key,
                                   const std::string &upload_id,
                                   const std::vector<UploadedPart> &parts,
                                   const Headers &metadata) override;

    Headers get_object_metadata(const std::string &bucket, const std::string &key) override;

    std::filesystem::path object_path(const std::string &bucket, const std::string &key) const;

    std::filesystem::path upload_dir(const std::string &upload_id) const;

  private:
    std::filesystem::path session_dir(const std::string &bucket, const std::string &key,
                                      const std::string &upload_id) const;

    DirectoryStorageConfig config_;
    std::mutex mutex_;
    std::uint64_t next_upload_{0};
};

} // namespace mpu
