#include "mpu/file_source.hpp"

#include "mpu/errors.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace mpu {

namespace {

class LocalRangeStream : public ByteRangeStream {
  public:
    LocalRangeStream(const std::filesystem::path &path, std::uint64_t offset,
                     std::uint64_t length)
        : path_(path), file_(path, std::ios::binary), length_(length) {
        if (!file_) {
            throw Error("failed to open source file '" + path.string() + "'");
        }
        file_.seekg(static_cast<std::streamoff>(offset));
        if (!file_) {
            std::ostringstream oss;
            oss << "failed to seek to offset " << offset << " in '" << path.string() << "'";
            throw Error(oss.str());
        }
    }

    std::size_t read(char *buffer, std::size_t size) override {
        const auto remaining = length_ - consumed_;
        const auto to_read =
            static_cast<std::size_t>(std::min<std::uint64_t>(remaining, size));
        if (to_read == 0) {
            return 0;
        }
        file_.read(buffer, static_cast<std::streamsize>(to_read));
        const auto read = file_.gcount();
        if (read <= 0) {
            throw Error("unexpected EOF while reading '" + path_.string() + "'");
        }
        consumed_ += static_cast<std::uint64_t>(read);
        return static_cast<std::size_t>(read);
    }

    std::uint64_t length() const noexcept override { return length_; }

  private:
    std::filesystem::path path_;
    std::ifstream file_;
    std::uint64_t length_;
    std::uint64_t consumed_{0};
};

} // namespace

bool LocalFileSource::exists(const std::filesystem::path &path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

FileStat LocalFileSource::stat(const std::filesystem::path &path) const {
    struct ::stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            throw FileNotFoundError(path);
        }
        std::ostringstream oss;
        oss << "stat failed for '" << path.string() << "': " << std::strerror(errno);
        throw Error(oss.str());
    }
    FileStat result{};
    result.size = static_cast<std::uint64_t>(st.st_size);
    result.modified_time_ms = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1000 +
                              static_cast<std::int64_t>(st.st_mtim.tv_nsec) / 1000000;
    return result;
}

std::unique_ptr<ByteRangeStream> LocalFileSource::open_range(const std::filesystem::path &path,
                                                             std::uint64_t offset,
                                                             std::uint64_t length) const {
    if (!exists(path)) {
        throw FileNotFoundError(path);
    }
    return std::make_unique<LocalRangeStream>(path, offset, length);
}

} // namespace mpu
