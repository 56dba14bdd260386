#include "mpu/storage_client.hpp"

#include <algorithm>
#include <cctype>

namespace mpu {

bool HeaderNameLess::operator()(const std::string &lhs, const std::string &rhs) const {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) <
                   std::tolower(static_cast<unsigned char>(b));
        });
}

} // namespace mpu
