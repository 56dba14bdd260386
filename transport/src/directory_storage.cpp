#include "mpu/directory_storage.hpp"

#include "mpu/errors.hpp"
#include "mpu/object_metadata.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mpu {

namespace {

constexpr std::size_t kBufferSize = 1u << 20;
constexpr char kUploadsDir[] = ".uploads";
constexpr char kTargetFile[] = "target";
constexpr char kPartPrefix[] = "part-";

void validate_location(const std::string &bucket, const std::string &key) {
    if (bucket.empty() || bucket.front() == '.' || bucket.find('/') != std::string::npos) {
        throw StorageError(400, "invalid bucket name: '" + bucket + "'");
    }
    const std::filesystem::path key_path(key);
    if (key.empty() || key_path.is_absolute()) {
        throw StorageError(400, "invalid object key: '" + key + "'");
    }
    for (const auto &component : key_path) {
        if (component == ".." || component == ".") {
            throw StorageError(400, "invalid object key: '" + key + "'");
        }
    }
}

std::filesystem::path meta_path(const std::filesystem::path &object) {
    auto path = object;
    path += ".meta";
    return path;
}

std::string part_file_name(std::uint32_t part_number) {
    return kPartPrefix + std::to_string(part_number);
}

// Returns 0 for anything that is not a committed part file.
std::uint32_t parse_part_file_name(const std::string &name) {
    const std::string prefix(kPartPrefix);
    if (name.compare(0, prefix.size(), prefix) != 0 || name.size() == prefix.size()) {
        return 0;
    }
    std::uint64_t number = 0;
    for (std::size_t i = prefix.size(); i < name.size(); ++i) {
        const char c = name[i];
        if (c < '0' || c > '9') {
            return 0;
        }
        number = number * 10 + static_cast<std::uint64_t>(c - '0');
        if (number > UINT32_MAX) {
            return 0;
        }
    }
    return static_cast<std::uint32_t>(number);
}

std::uint64_t expected_length(const Headers &headers) {
    auto it = headers.find(headers::kContentLength);
    if (it == headers.end()) {
        throw StorageError(411, "missing Content-Length header");
    }
    const auto &value = it->second;
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw StorageError(400, "invalid Content-Length header: '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range &) {
        throw StorageError(400, "Content-Length out of range: '" + value + "'");
    }
}

void copy_into(std::ofstream &out, const std::filesystem::path &source) {
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        throw StorageError(500, "failed to open part file '" + source.string() + "'");
    }
    std::vector<char> buffer(kBufferSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto read = in.gcount();
        if (read <= 0) {
            break;
        }
        out.write(buffer.data(), read);
        if (!out) {
            throw StorageError(500, "failed to write object data");
        }
    }
}

} // namespace

DirectoryStorageClient::DirectoryStorageClient(DirectoryStorageConfig config)
    : config_(std::move(config)) {
    if (config_.root.empty()) {
        throw std::invalid_argument("storage root must not be empty");
    }
    if (config_.max_parts == 0) {
        throw std::invalid_argument("max parts must be > 0");
    }
    std::filesystem::create_directories(config_.root / kUploadsDir);
}

std::string DirectoryStorageClient::initiate_multipart_upload(const std::string &bucket,
                                                              const std::string &key) {
    validate_location(bucket, key);
    std::string upload_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = std::chrono::system_clock::now().time_since_epoch();
        std::ostringstream oss;
        oss << std::hex << std::setfill('0') << std::setw(16)
            << static_cast<std::uint64_t>(
                   std::chrono::duration_cast<std::chrono::microseconds>(now).count())
            << std::setw(8) << next_upload_++;
        upload_id = oss.str();
    }
    const auto dir = upload_dir(upload_id);
    std::filesystem::create_directories(dir);
    std::ofstream target(dir / kTargetFile, std::ios::trunc);
    target << bucket << '\n' << key << '\n';
    if (!target) {
        throw StorageError(500, "failed to record upload target in '" + dir.string() + "'");
    }
    return upload_id;
}

PartListing DirectoryStorageClient::list_parts(const std::string &bucket, const std::string &key,
                                               const std::string &upload_id) {
    const auto dir = session_dir(bucket, key, upload_id);
    PartListing listing{{}, config_.max_parts};
    for (const auto &entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto number = parse_part_file_name(entry.path().filename().string());
        if (number == 0) {
            continue;
        }
        listing.parts.push_back(UploadedPart{number, entry.file_size()});
    }
    return listing;
}

void DirectoryStorageClient::upload_part(const std::string &bucket, const std::string &key,
                                         PartBody &body, const Headers &headers,
                                         const PartParams &params) {
    const auto dir = session_dir(bucket, key, params.upload_id);
    if (params.part_number == 0 || params.part_number > config_.max_parts) {
        std::ostringstream oss;
        oss << "part number " << params.part_number << " outside [1, " << config_.max_parts << "]";
        throw StorageError(400, oss.str());
    }
    const auto length = expected_length(headers);
    const auto final_path = dir / part_file_name(params.part_number);
    auto tmp_path = final_path;
    tmp_path += ".tmp";

    std::uint64_t received = 0;
    try {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError(500, "failed to open '" + tmp_path.string() + "'");
        }
        std::vector<char> buffer(kBufferSize);
        while (true) {
            const auto read = body.read(buffer.data(), buffer.size());
            if (read == 0) {
                break;
            }
            out.write(buffer.data(), static_cast<std::streamsize>(read));
            if (!out) {
                throw StorageError(500, "failed to write '" + tmp_path.string() + "'");
            }
            received += read;
        }
        out.close();
        if (received != length) {
            std::ostringstream oss;
            oss << "part " << params.part_number << " received " << received
                << " bytes, Content-Length was " << length;
            throw StorageError(400, oss.str());
        }
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        throw;
    }
    std::filesystem::rename(tmp_path, final_path);
}

void DirectoryStorageClient::complete_multipart_upload(const std::string &bucket,
                                                       const std::string &key,
                                                       const std::string &upload_id,
                                                       const std::vector<UploadedPart> &parts,
                                                       const Headers &metadata) {
    const auto dir = session_dir(bucket, key, upload_id);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto &part = parts[i];
        if (part.part_number != i + 1) {
            throw StorageError(400, "parts must be contiguous and ordered from 1");
        }
        const auto path = dir / part_file_name(part.part_number);
        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        if (ec || size != part.size) {
            throw StorageError(400, "invalid part " + std::to_string(part.part_number));
        }
    }

    const auto object = object_path(bucket, key);
    std::filesystem::create_directories(object.parent_path());
    auto tmp_object = object;
    tmp_object += ".tmp";
    try {
        std::ofstream out(tmp_object, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError(500, "failed to open '" + tmp_object.string() + "'");
        }
        for (const auto &part : parts) {
            copy_into(out, dir / part_file_name(part.part_number));
        }
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(tmp_object, ec);
        throw;
    }
    std::filesystem::rename(tmp_object, object);

    std::ofstream meta(meta_path(object), std::ios::trunc);
    for (const auto &header : metadata) {
        meta << header.first << ": " << header.second << '\n';
    }
    if (!meta) {
        throw StorageError(500, "failed to write metadata for '" + key + "'");
    }
    std::filesystem::remove_all(dir);
}

Headers DirectoryStorageClient::get_object_metadata(const std::string &bucket,
                                                    const std::string &key) {
    const auto object = object_path(bucket, key);
    if (!std::filesystem::is_regular_file(object)) {
        throw StorageError(404, "object not found: " + bucket + "/" + key);
    }
    Headers result;
    std::ifstream meta(meta_path(object));
    std::string line;
    while (std::getline(meta, line)) {
        const auto colon = line.find(": ");
        if (colon == std::string::npos) {
            continue;
        }
        result[line.substr(0, colon)] = line.substr(colon + 2);
    }
    result[headers::kContentLength] = std::to_string(std::filesystem::file_size(object));
    return result;
}

std::filesystem::path DirectoryStorageClient::object_path(const std::string &bucket,
                                                          const std::string &key) const {
    validate_location(bucket, key);
    return config_.root / bucket / std::filesystem::path(key);
}

std::filesystem::path DirectoryStorageClient::upload_dir(const std::string &upload_id) const {
    return config_.root / kUploadsDir / upload_id;
}

std::filesystem::path DirectoryStorageClient::session_dir(const std::string &bucket,
                                                          const std::string &key,
                                                          const std::string &upload_id) const {
    validate_location(bucket, key);
    if (upload_id.empty() || upload_id.find('/') != std::string::npos || upload_id.front() == '.') {
        throw StorageError(404, "no such upload: '" + upload_id + "'");
    }
    const auto dir = upload_dir(upload_id);
    std::ifstream target(dir / kTargetFile);
    std::string target_bucket;
    std::string target_key;
    if (!target || !std::getline(target, target_bucket) || !std::getline(target, target_key)) {
        throw StorageError(404, "no such upload: '" + upload_id + "'");
    }
    if (target_bucket != bucket || target_key != key) {
        throw StorageError(400, "upload '" + upload_id + "' belongs to " + target_bucket + "/" +
                                    target_key);
    }
    return dir;
}

} // namespace mpu
