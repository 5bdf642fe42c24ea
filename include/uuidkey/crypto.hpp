#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace uuidkey::crypto {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::size_t kSha256Length = 32;

// Both throw std::runtime_error when OpenSSL reports a failure.
Bytes RandomBytes(std::size_t size);
Bytes Sha256(const Bytes& data);

// IEEE 802.3 CRC-32 (zlib) over the raw bytes of `data`.
std::uint32_t Crc32(const std::string& data);

}  // namespace uuidkey::crypto
