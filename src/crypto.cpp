#include "uuidkey/crypto.hpp"

#include "uuidkey/crypto_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <zlib.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace uuidkey::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

}  // namespace

Bytes RandomBytes(std::size_t size) {
    Bytes out(size);
    if (size == 0) {
        return out;
    }
    Ensure(size <= static_cast<std::size_t>(std::numeric_limits<int>::max()), "RAND_bytes request too large");
    Ensure(RAND_bytes(out.data(), static_cast<int>(out.size())) == 1, "RAND_bytes failed");
    return out;
}

Bytes Sha256(const Bytes& data) {
    detail::UniqueMDCtx ctx(EVP_MD_CTX_new());
    Ensure(ctx != nullptr, "Digest context allocation failed");
    Bytes out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    Ensure(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1, "SHA-256 init failed");
    if (!data.empty()) {
        Ensure(EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1, "SHA-256 update failed");
    }
    Ensure(EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) == 1, "SHA-256 final failed");
    Ensure(out_len == kSha256Length, "SHA-256 digest has unexpected length");
    out.resize(out_len);
    return out;
}

std::uint32_t Crc32(const std::string& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    const auto* bytes = reinterpret_cast<const Bytef*>(data.data());
    std::size_t remaining = data.size();
    // zlib takes uInt lengths; feed oversized inputs in slices.
    while (remaining > 0) {
        uInt chunk = static_cast<uInt>(std::min<std::size_t>(remaining, std::numeric_limits<uInt>::max()));
        crc = crc32(crc, bytes, chunk);
        bytes += chunk;
        remaining -= chunk;
    }
    return static_cast<std::uint32_t>(crc);
}

}  // namespace uuidkey::crypto
