#include "crypto.h"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

using MD_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// legacy keccak padding (0x01), not the SHA3-256 (0x06) variant
static const EVP_MD* keccak256() {
    static MD_ptr md(EVP_MD_fetch(nullptr, "KECCAK-256", nullptr), EVP_MD_free);
    if (!md) throw std::runtime_error("KECCAK-256 digest is not available");
    return md.get();
}

static MD_CTX_ptr makeCtx() {
    MD_CTX_ptr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("Failed to allocate EVP_MD_CTX");
    if (EVP_DigestInit_ex(ctx.get(), keccak256(), nullptr) <= 0) {
        throw std::runtime_error("EVP digest init failed");
    }
    return ctx;
}

static Digest finish(EVP_MD_CTX* ctx) {
    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, out.data(), &len) <= 0 || len != out.size()) {
        throw std::runtime_error("EVP digest final failed");
    }
    return out;
}

Digest Keccak256Hash(const uint8_t* data, size_t len) {
    MD_CTX_ptr ctx = makeCtx();
    if (EVP_DigestUpdate(ctx.get(), data, len) <= 0) {
        throw std::runtime_error("EVP digest update failed");
    }
    return finish(ctx.get());
}

Digest Keccak256Hash(const std::vector<uint8_t>& data) {
    return Keccak256Hash(data.data(), data.size());
}

Digest Keccak256Hash(const uint8_t* first, size_t firstLen, const uint8_t* second,
                     size_t secondLen) {
    MD_CTX_ptr ctx = makeCtx();
    if (EVP_DigestUpdate(ctx.get(), first, firstLen) <= 0 ||
        EVP_DigestUpdate(ctx.get(), second, secondLen) <= 0) {
        throw std::runtime_error("EVP digest update failed");
    }
    return finish(ctx.get());
}
