#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace uuidkey::format {

using Bytes = std::vector<std::uint8_t>;

std::string HexEncode(const Bytes& data);
Bytes HexDecode(const std::string& input, bool* ok = nullptr);

// Eight upper-case hex digits, zero padded.
std::string HexU32Upper(std::uint32_t value);

// Left-pads or strips leading zero bytes so the result is exactly `width`
// bytes. Fails when the value does not fit.
Bytes FitBigEndian(const Bytes& data, std::size_t width, bool* ok = nullptr);

// 16 bytes -> lower-case 8-4-4-4-12 text.
std::string FormatUuid(const Bytes& bytes);

// 36 characters, hyphens at 8, 13, 18 and 23, hex digits elsewhere.
bool IsUuidText(const std::string& text);

}  // namespace uuidkey::format
