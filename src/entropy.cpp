#include "uuidkey/entropy.hpp"

#include "uuidkey/crockford.hpp"
#include "uuidkey/crypto.hpp"
#include "uuidkey/log.hpp"

#include <stdexcept>
#include <utility>

namespace uuidkey {

std::size_t EntropySourceBytes(EntropyClass entropy) noexcept {
    return (EntropyLength(entropy) * 8 + 4) / 5;
}

std::string EncodeEntropyDigest(const crypto::Bytes& digest, EntropyClass entropy) {
    const std::size_t length = EntropyLength(entropy);
    std::string encoded = crockford::Encode(digest);
    // Only a digest with fifteen or more leading zero bytes can encode to fewer than 42 symbols.
    if (encoded.size() < length) {
        encoded.insert(0, length - encoded.size(), '0');
    }
    encoded.resize(length);
    return encoded;
}

Result<std::string> GenerateEntropy(EntropyClass entropy) {
    crypto::Bytes digest;
    try {
        digest = crypto::Sha256(crypto::RandomBytes(EntropySourceBytes(entropy)));
    } catch (const std::runtime_error& exc) {
        log::Warn(std::string("entropy generation failed: ") + exc.what());
        return Result<std::string>::Fail(ErrorCode::EntropyUnavailable, exc.what());
    }
    return Result<std::string>::Ok(EncodeEntropyDigest(digest, entropy));
}

}  // namespace uuidkey
