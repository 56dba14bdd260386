#include "mpu/part_planner.hpp"

#include "mpu/errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace mpu {

PartPlanner::PartPlanner(std::uint64_t part_size_bytes) : part_size_bytes_(part_size_bytes) {
    if (part_size_bytes_ == 0) {
        throw std::invalid_argument("part size must be > 0");
    }
}

std::vector<PartDescriptor> PartPlanner::decompose(const std::vector<UploadedPart> &accepted,
                                                   std::uint32_t max_parts,
                                                   std::uint64_t uploaded_bytes,
                                                   std::uint64_t total_size) const {
    if (uploaded_bytes > total_size) {
        std::ostringstream oss;
        oss << "remote parts cover " << uploaded_bytes << " bytes but the file has only "
            << total_size;
        throw Error(oss.str());
    }
    std::vector<PartDescriptor> parts;
    std::uint64_t remaining = total_size - uploaded_bytes;
    if (remaining == 0) {
        return parts;
    }
    if (max_parts <= accepted.size()) {
        std::ostringstream oss;
        oss << "part limit reached: " << accepted.size() << " of " << max_parts
            << " parts already accepted with " << remaining << " bytes left";
        throw Error(oss.str());
    }

    const std::uint64_t budget = max_parts - accepted.size();
    const std::uint64_t min_part_size = (total_size + budget - 1) / budget;
    const std::uint64_t part_size = std::max(part_size_bytes_, min_part_size);

    parts.reserve(static_cast<std::size_t>(remaining / part_size) + 1);
    std::uint64_t offset = uploaded_bytes;
    auto part_number = static_cast<std::uint32_t>(accepted.size() + 1);
    while (remaining > 0) {
        const auto size = std::min(remaining, part_size);
        parts.push_back(PartDescriptor{part_number, offset, size});
        remaining -= size;
        offset += size;
        ++part_number;
    }
    return parts;
}

std::vector<UploadedPart> PartPlanner::order_parts(std::vector<UploadedPart> parts) {
    std::sort(parts.begin(), parts.end(), [](const UploadedPart &lhs, const UploadedPart &rhs) {
        return lhs.part_number < rhs.part_number;
    });
    return parts;
}

std::uint64_t PartPlanner::committed_bytes(const std::vector<UploadedPart> &parts) {
    std::uint64_t total = 0;
    for (const auto &part : parts) {
        total += part.size;
    }
    return total;
}

std::uint64_t PartPlanner::part_size_bytes() const noexcept { return part_size_bytes_; }

} // namespace mpu
