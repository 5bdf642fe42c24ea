#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace uuidkey::crockford {

// Base32-Crockford, alphabet 0-9 A-Z without I, L, O and U.
//
// The byte string is treated as a big-endian number written in base 32 without
// leading zero symbols, after which one '0' symbol is emitted per leading zero
// byte. Decode reverses this, so Decode(Encode(b)) == b for every b.
std::string Encode(const std::vector<std::uint8_t>& data);
std::vector<std::uint8_t> Decode(const std::string& input, bool* ok = nullptr);

// Case-insensitive membership test for the Crockford alphabet.
bool IsSymbol(char ch);

}  // namespace uuidkey::crockford
