#include "beacon/core/security/digest.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace beacon::core::security {
namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

std::string to_hex(const unsigned char* data, unsigned int length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(static_cast<std::size_t>(length) * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(kDigits[data[i] >> 4]);
        hex.push_back(kDigits[data[i] & 0x0f]);
    }
    return hex;
}

}  // namespace

std::string sha256_hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), md, &md_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return to_hex(md, md_len);
}

std::string sha256_prefix(std::string_view data, std::size_t length) {
    auto digest = sha256_hex(data);
    if (length < digest.size()) {
        digest.resize(length);
    }
    return digest;
}

}  // namespace beacon::core::security
