#include "digest.hpp"
#include "random.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>
#include <vector>

namespace auditstore {

std::string sha256_hex(const std::string &data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    std::vector<std::uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) <= 0 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) <= 0 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) <= 0) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    out.resize(len);
    return to_hex(out);
}

} // namespace auditstore
