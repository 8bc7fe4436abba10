#include "Checksum.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <vector>

namespace {

// EVP_MD_CTX 的 RAII 包装
struct DigestContext {
    EVP_MD_CTX* ctx;
    DigestContext() : ctx(EVP_MD_CTX_new()) {}
    ~DigestContext() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
    DigestContext(const DigestContext&) = delete;
    DigestContext& operator=(const DigestContext&) = delete;
};

} // namespace

std::string Checksum::toHex(const unsigned char* digest, unsigned int length) {
    static const char* const kHexDigits = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        hex += kHexDigits[digest[i] >> 4];
        hex += kHexDigits[digest[i] & 0x0f];
    }
    return hex;
}

std::string Checksum::sha256Hex(const std::string& data) {
    DigestContext context;
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (!context.ctx ||
        EVP_DigestInit_ex(context.ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(context.ctx, data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(context.ctx, digest, &length) != 1) {
        return std::string();
    }
    return toHex(digest, length);
}

bool Checksum::sha256File(const std::string& path, std::string& hexDigest) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    DigestContext context;
    if (!context.ctx || EVP_DigestInit_ex(context.ctx, EVP_sha256(), nullptr) != 1) {
        return false;
    }

    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize count = in.gcount();
        if (count > 0 && EVP_DigestUpdate(context.ctx, buffer.data(), static_cast<size_t>(count)) != 1) {
            return false;
        }
    }
    if (in.bad()) {
        return false;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.ctx, digest, &length) != 1) {
        return false;
    }
    hexDigest = toHex(digest, length);
    return true;
}
