//! # Content Hashing
//!
//! OpenSSL EVP SHA-256. One digest context per call, so every function here
//! is safe to use from any number of scanner or build workers at once.

#include "common/content_hash.hpp"

#include <fstream>
#include <memory>
#include <openssl/evp.h>

namespace cyforge {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        EVP_MD_CTX_free(ctx);
    }
};

using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

EvpCtx new_sha256_ctx() {
    EvpCtx ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

std::string finish(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        return {};
    }
    return to_hex(digest, len);
}

} // namespace

std::string to_hex(const unsigned char* data, size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out[2 * i] = digits[data[i] >> 4];
        out[2 * i + 1] = digits[data[i] & 0x0F];
    }
    return out;
}

std::string hash_bytes(std::string_view data) {
    auto ctx = new_sha256_ctx();
    if (!ctx) {
        return {};
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    return finish(ctx.get());
}

Result<std::string, CacheError> hash_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return CacheError{path.string(), "cannot open for hashing"};
    }

    auto ctx = new_sha256_ctx();
    if (!ctx) {
        return CacheError{path.string(), "sha256 context unavailable"};
    }

    char buffer[64 * 1024];
    while (file) {
        file.read(buffer, sizeof(buffer));
        auto got = file.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(got)) != 1) {
            return CacheError{path.string(), "sha256 update failed"};
        }
    }
    if (file.bad()) {
        return CacheError{path.string(), "read error"};
    }

    auto digest = finish(ctx.get());
    if (digest.empty()) {
        return CacheError{path.string(), "sha256 finalize failed"};
    }
    return digest;
}

} // namespace cyforge
