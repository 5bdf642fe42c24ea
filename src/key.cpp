#include "uuidkey/key.hpp"

#include "uuidkey/crockford.hpp"
#include "uuidkey/format.hpp"
#include "uuidkey/log.hpp"

#include <ostream>

namespace uuidkey {

namespace {

using constants::kKeyHyphen;
using constants::kKeyPartLength;

bool IsValidPart(const std::string& value, std::size_t offset) {
    if (offset + kKeyPartLength > value.size()) {
        return false;
    }
    for (std::size_t i = offset; i < offset + kKeyPartLength; ++i) {
        if (!crockford::IsSymbol(value[i])) {
            return false;
        }
    }
    return true;
}

// Start of each group: 0, 7, 14, 21 without hyphens, 0, 8, 16, 24 with.
std::size_t PartOffset(std::size_t index, bool hyphens) {
    return index * (kKeyPartLength + (hyphens ? 1 : 0));
}

std::string EncodePart(const std::string& hex) {
    bool ok = false;
    format::Bytes bytes = format::HexDecode(hex, &ok);
    std::string encoded = ok ? crockford::Encode(bytes) : std::string();
    if (encoded.size() < kKeyPartLength) {
        encoded.insert(0, kKeyPartLength - encoded.size(), '0');
    }
    return encoded;
}

}  // namespace

bool Key::IsValid(const std::string& value) {
    bool hyphens = false;
    if (value.size() == constants::kKeyLengthWithHyphens) {
        hyphens = true;
        for (std::size_t i = 1; i < constants::kKeyPartsCount; ++i) {
            if (value[PartOffset(i, true) - 1] != kKeyHyphen) {
                return false;
            }
        }
    } else if (value.size() != constants::kKeyLengthWithoutHyphens) {
        return false;
    }
    for (std::size_t i = 0; i < constants::kKeyPartsCount; ++i) {
        if (!IsValidPart(value, PartOffset(i, hyphens))) {
            return false;
        }
    }
    return true;
}

Result<Key> Key::Parse(const std::string& value) {
    if (!IsValid(value)) {
        log::Debug("rejected key of length " + std::to_string(value.size()));
        return Result<Key>::Fail(ErrorCode::InvalidKeyFormat, "Invalid Key format");
    }
    return Result<Key>::Ok(Key(value));
}

Result<Key> Key::Encode(const std::string& uuid, bool with_hyphens) {
    if (uuid.size() != constants::kUuidLength) {
        return Result<Key>::Fail(ErrorCode::InvalidUuidLength, "Invalid UUID length");
    }
    if (!format::IsUuidText(uuid)) {
        return Result<Key>::Fail(ErrorCode::InvalidUuidFormat, "Invalid UUID format");
    }
    const std::string groups[constants::kKeyPartsCount] = {
        uuid.substr(0, 8),
        uuid.substr(9, 4) + uuid.substr(14, 4),
        uuid.substr(19, 4) + uuid.substr(24, 4),
        uuid.substr(28, 8),
    };
    std::string value;
    value.reserve(constants::kKeyLengthWithHyphens);
    for (std::size_t i = 0; i < constants::kKeyPartsCount; ++i) {
        if (with_hyphens && i > 0) {
            value.push_back(kKeyHyphen);
        }
        value += EncodePart(groups[i]);
    }
    return Parse(value);
}

Key::Parts Key::GetParts() const {
    Parts parts;
    const bool hyphens = HasHyphens();
    for (std::size_t i = 0; i < parts.size(); ++i) {
        parts[i] = value_.substr(PartOffset(i, hyphens), kKeyPartLength);
    }
    return parts;
}

Result<std::string> Key::ToUuid() const {
    if (!IsValid(value_)) {
        return Result<std::string>::Fail(ErrorCode::InvalidKeyFormat, "Invalid UUID key");
    }
    format::Bytes bytes;
    bytes.reserve(constants::kUuidByteLength);
    for (const std::string& part : GetParts()) {
        bool ok = false;
        format::Bytes decoded = crockford::Decode(part, &ok);
        if (ok) {
            decoded = format::FitBigEndian(decoded, constants::kUuidGroupBytes, &ok);
        }
        if (!ok) {
            return Result<std::string>::Fail(ErrorCode::InvalidKeyFormat,
                                             "Invalid UUID key: group " + part + " exceeds 32 bits");
        }
        bytes.insert(bytes.end(), decoded.begin(), decoded.end());
    }
    return Result<std::string>::Ok(format::FormatUuid(bytes));
}

std::ostream& operator<<(std::ostream& os, const Key& key) {
    return os << key.ToString();
}

}  // namespace uuidkey
