#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct evp_md_ctx_st;

namespace mpu {

class ContentHash {
  public:
    // Files this large are compared by modification time instead of hashed.
    static constexpr std::uint64_t kMaxHashableSize = 4ull * 1024 * 1024 * 1024;

    static bool hashable(std::uint64_t size) noexcept { return size < kMaxHashableSize; }

    // Base64 of the raw 16-byte digest, the encoding stored in x-bce-meta-md5.
    static std::string md5_base64(const std::vector<char> &data);

    class Md5Accumulator {
      public:
        Md5Accumulator();
        ~Md5Accumulator();

        Md5Accumulator(const Md5Accumulator &) = delete;
        Md5Accumulator &operator=(const Md5Accumulator &) = delete;

        void update(const char *data, std::size_t size);

        // Finalizes the digest; further updates are rejected.
        std::string base64();

      private:
        struct ContextDeleter {
            void operator()(evp_md_ctx_st *ctx) const noexcept;
        };

        std::unique_ptr<evp_md_ctx_st, ContextDeleter> ctx_;
        std::string digest_;
    };
};

} // namespace mpu
