#pragma once

#include <array>
#include <iosfwd>
#include <string>
#include <utility>

#include "uuidkey/constants.hpp"
#include "uuidkey/error.hpp"

namespace uuidkey {

// A UUID written as four 7-symbol Base32-Crockford groups, each carrying four
// bytes of the UUID:
//
//   38QARV0-1ET0G6Z-2CJD9VA-2ZZAR0X   (31 characters, hyphenated)
//   38QARV01ET0G6Z2CJD9VA2ZZAR0X      (28 characters)
//
// The fixed group width lets the compound ApiKey format locate the Key by
// length alone.
class Key {
public:
    using Parts = std::array<std::string, constants::kKeyPartsCount>;

    static bool IsValid(const std::string& value);

    // Validates and keeps `value` exactly as given.
    static Result<Key> Parse(const std::string& value);

    // Encodes a 36-character UUID. The result is always upper case.
    static Result<Key> Encode(const std::string& uuid, bool with_hyphens = true);

    // Lower-case 8-4-4-4-12 UUID text.
    Result<std::string> ToUuid() const;

    const std::string& ToString() const noexcept { return value_; }
    bool HasHyphens() const noexcept { return value_.size() == constants::kKeyLengthWithHyphens; }
    Parts GetParts() const;

    bool operator==(const Key& other) const noexcept { return value_ == other.value_; }
    bool operator!=(const Key& other) const noexcept { return value_ != other.value_; }

private:
    explicit Key(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

std::ostream& operator<<(std::ostream& os, const Key& key);

}  // namespace uuidkey
