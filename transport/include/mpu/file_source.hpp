#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace mpu {

struct FileStat {
    std::uint64_t size;
    std::int64_t modified_time_ms;
};

// Bounded read over a byte range of a file. read() returns 0 once the range is
// exhausted.
class ByteRangeStream {
  public:
    virtual ~ByteRangeStream() = default;

    virtual std::size_t read(char *buffer, std::size_t size) = 0;

    virtual std::uint64_t length() const noexcept = 0;
};

class FileSource {
  public:
    virtual ~FileSource() = default;

    virtual bool exists(const std::filesystem::path &path) const = 0;

    virtual FileStat stat(const std::filesystem::path &path) const = 0;

    virtual std::unique_ptr<ByteRangeStream> open_range(const std::filesystem::path &path,
                                                        std::uint64_t offset,
                                                        std::uint64_t length) const = 0;
};

class LocalFileSource : public FileSource {
  public:
    bool exists(const std::filesystem::path &path) const override;

    FileStat stat(const std::filesystem::path &path) const override;

    std::unique_ptr<ByteRangeStream> open_range(const std::filesystem::path &path,
                                                std::uint64_t offset,
                                                std::uint64_t length) const override;
};

} // namespace mpu
