#include "mpu/content_hash.hpp"

#include "mpu/errors.hpp"

#include <openssl/evp.h>

namespace mpu {

namespace {

std::string to_base64(const unsigned char *digest, unsigned int size) {
    unsigned char encoded[4 * ((EVP_MAX_MD_SIZE + 2) / 3) + 1];
    const int length = EVP_EncodeBlock(encoded, digest, static_cast<int>(size));
    if (length < 0) {
        throw Error("base64 encoding of md5 digest failed");
    }
    return std::string(reinterpret_cast<const char *>(encoded), static_cast<std::size_t>(length));
}

} // namespace

std::string ContentHash::md5_base64(const std::vector<char> &data) {
    Md5Accumulator accumulator;
    accumulator.update(data.data(), data.size());
    return accumulator.base64();
}

void ContentHash::Md5Accumulator::ContextDeleter::operator()(evp_md_ctx_st *ctx) const noexcept {
    EVP_MD_CTX_free(ctx);
}

ContentHash::Md5Accumulator::Md5Accumulator() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw Error("failed to allocate md5 context");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_md5(), nullptr) != 1) {
        throw Error("failed to initialize md5 digest");
    }
}

ContentHash::Md5Accumulator::~Md5Accumulator() = default;

void ContentHash::Md5Accumulator::update(const char *data, std::size_t size) {
    if (data == nullptr || size == 0) {
        return;
    }
    if (!digest_.empty()) {
        throw Error("md5 digest already finalized");
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw Error("md5 digest update failed");
    }
}

std::string ContentHash::Md5Accumulator::base64() {
    if (digest_.empty()) {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int size = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), digest, &size) != 1) {
            throw Error("md5 digest finalization failed");
        }
        digest_ = to_base64(digest, size);
    }
    return digest_;
}

} // namespace mpu
