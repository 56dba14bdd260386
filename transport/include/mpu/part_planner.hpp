#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mpu {

constexpr std::uint64_t kDefaultPartSize = 20ull * 1024 * 1024;

// A part the remote session has already accepted.
struct UploadedPart {
    std::uint32_t part_number;
    std::uint64_t size;
};

struct PartDescriptor {
    std::uint32_t part_number;
    std::uint64_t offset;
    std::uint64_t size;
};

class PartPlanner {
  public:
    explicit PartPlanner(std::uint64_t part_size_bytes = kDefaultPartSize);

    // Plans the parts still missing after `accepted`. Every part but the last is
    // equal-sized and at least part_size_bytes(), and the plan never needs more
    // than max_parts - accepted.size() parts.
    std::vector<PartDescriptor> decompose(const std::vector<UploadedPart> &accepted,
                                          std::uint32_t max_parts, std::uint64_t uploaded_bytes,
                                          std::uint64_t total_size) const;

    static std::vector<UploadedPart> order_parts(std::vector<UploadedPart> parts);

    static std::uint64_t committed_bytes(const std::vector<UploadedPart> &parts);

    std::uint64_t part_size_bytes() const noexcept;

  private:
    std::uint64_t part_size_bytes_;
};

} // namespace mpu
