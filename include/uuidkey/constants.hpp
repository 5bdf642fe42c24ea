#pragma once

#include <cstddef>
#include <string_view>

namespace uuidkey::constants {

// A Key is four 7-symbol groups, optionally joined by three hyphens.
inline constexpr std::size_t kKeyPartLength = 7;
inline constexpr std::size_t kKeyPartsCount = 4;
inline constexpr std::size_t kKeyHyphenCount = 3;
inline constexpr std::size_t kKeyLengthWithoutHyphens = kKeyPartLength * kKeyPartsCount;
inline constexpr std::size_t kKeyLengthWithHyphens = kKeyLengthWithoutHyphens + kKeyHyphenCount;
inline constexpr char kKeyHyphen = '-';

// RFC 4122 textual form, 8-4-4-4-12.
inline constexpr std::size_t kUuidLength = 36;
inline constexpr std::size_t kUuidByteLength = 16;
inline constexpr std::size_t kUuidGroupBytes = 4;

inline constexpr std::size_t kChecksumLength = 8;
inline constexpr char kSeparator = '_';
inline constexpr std::size_t kApiKeyPartsCount = 3;

inline constexpr std::string_view kEnvEntropyBits = "UUIDKEY_ENTROPY_BITS";
inline constexpr std::string_view kEnvHyphens = "UUIDKEY_HYPHENS";
inline constexpr std::string_view kEnvDebug = "UUIDKEY_DEBUG";
inline constexpr std::string_view kEnvNoColor = "UUIDKEY_NO_COLOR";

}  // namespace uuidkey::constants
