#pragma once

#include <cstddef>
#include <string>

#include "uuidkey/config.hpp"
#include "uuidkey/crypto.hpp"
#include "uuidkey/error.hpp"

namespace uuidkey {

// Random bytes drawn for a class: ceil(EntropyLength * 8 / 5).
std::size_t EntropySourceBytes(EntropyClass entropy) noexcept;

// First EntropyLength(entropy) Crockford symbols of a SHA-256 digest.
std::string EncodeEntropyDigest(const crypto::Bytes& digest, EntropyClass entropy);

// Upper-case Base32-Crockford string of exactly EntropyLength(entropy)
// symbols. Random bytes come from OpenSSL and are whitened with SHA-256 before
// encoding. Fails with EntropyUnavailable when OpenSSL does.
Result<std::string> GenerateEntropy(EntropyClass entropy);

}  // namespace uuidkey
