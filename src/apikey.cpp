#include "uuidkey/apikey.hpp"

#include "uuidkey/constants.hpp"
#include "uuidkey/crypto.hpp"
#include "uuidkey/entropy.hpp"
#include "uuidkey/format.hpp"
#include "uuidkey/log.hpp"

#include <ostream>
#include <utility>

namespace uuidkey {

namespace {

using constants::kSeparator;

std::vector<std::string> Split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        std::size_t pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool IsValidChecksum(const std::string& checksum) {
    if (checksum.size() != constants::kChecksumLength) {
        return false;
    }
    for (char ch : checksum) {
        if (!((ch >= '0' && ch <= '9') || (ch >= 'A' && ch <= 'F'))) {
            return false;
        }
    }
    return true;
}

// The prefix shares the compound text with the separator, so it may not contain it.
std::optional<Error> CheckPrefix(const std::string& prefix) {
    if (prefix.empty()) {
        return Error(ErrorCode::EmptyPrefix, "prefix cannot be empty");
    }
    if (prefix.find(kSeparator) != std::string::npos) {
        return Error(ErrorCode::InvalidPrefix, std::string("prefix cannot contain '") + kSeparator + "'");
    }
    return std::nullopt;
}

Result<ApiKey> Reject(ErrorCode code, std::string message) {
    log::Debug("api key parse failed: " + message);
    return Result<ApiKey>::Fail(code, std::move(message));
}

}  // namespace

ApiKey::ApiKey(std::string prefix, Key key, std::string entropy, std::string checksum)
    : prefix_(std::move(prefix)),
      key_(std::move(key)),
      entropy_(std::move(entropy)),
      checksum_(std::move(checksum)) {}

Result<ApiKey> ApiKey::Assemble(std::string prefix, Key key, std::string entropy) {
    if (std::optional<Error> invalid = CheckPrefix(prefix)) {
        return std::move(*invalid);
    }
    std::string checksum = CalculateChecksum(prefix, key, entropy);
    return Result<ApiKey>::Ok(ApiKey(std::move(prefix), std::move(key), std::move(entropy), std::move(checksum)));
}

Result<ApiKey> ApiKey::Parse(const std::string& text) {
    if (text.empty()) {
        return Reject(ErrorCode::EmptyInput, "invalid APIKey format");
    }
    std::vector<std::string> parts = Split(text, kSeparator);
    if (parts.size() != constants::kApiKeyPartsCount) {
        return Reject(ErrorCode::WrongPartCount,
                      "invalid APIKey format: expected 3 parts, got " + std::to_string(parts.size()));
    }
    const std::string& prefix = parts[0];
    const std::string& remainder = parts[1];
    const std::string& checksum = parts[2];
    if (prefix.empty()) {
        return Reject(ErrorCode::EmptyPrefix, "invalid prefix: cannot be empty");
    }
    if (remainder.size() < constants::kKeyLengthWithoutHyphens) {
        return Reject(ErrorCode::InsufficientLength, "invalid Key format: insufficient length");
    }
    if (!IsValidChecksum(checksum)) {
        return Reject(ErrorCode::InvalidChecksumFormat, "invalid checksum format: must be 8 hexadecimal characters");
    }

    Result<Key> key = Key::Parse(remainder.substr(0, constants::kKeyLengthWithoutHyphens));
    if (!key) {
        return Reject(key.error().code, key.error().message);
    }
    std::string entropy = remainder.substr(constants::kKeyLengthWithoutHyphens);

    std::string expected = CalculateChecksum(prefix, key.value(), entropy);
    if (checksum != expected) {
        return Reject(ErrorCode::ChecksumMismatch, "invalid checksum: expected " + expected + ", got " + checksum);
    }
    return Result<ApiKey>::Ok(ApiKey(prefix, std::move(key).value(), std::move(entropy), checksum));
}

std::optional<EntropyClass> ApiKey::entropy_class() const {
    return EntropyClassFromLength(entropy_.size());
}

std::string ApiKey::ToString() const {
    std::string out;
    out.reserve(prefix_.size() + key_.ToString().size() + entropy_.size() + checksum_.size() + 2);
    out += prefix_;
    out.push_back(kSeparator);
    out += key_.ToString();
    out += entropy_;
    out.push_back(kSeparator);
    out += checksum_;
    return out;
}

bool ApiKey::operator==(const ApiKey& other) const noexcept {
    return prefix_ == other.prefix_ && key_ == other.key_ && entropy_ == other.entropy_
           && checksum_ == other.checksum_;
}

std::ostream& operator<<(std::ostream& os, const ApiKey& api_key) {
    return os << api_key.ToString();
}

std::string CalculateChecksum(const std::string& prefix, const Key& key, const std::string& entropy) {
    std::string data;
    data.reserve(prefix.size() + 1 + key.ToString().size() + entropy.size());
    data += prefix;
    data.push_back(kSeparator);
    data += key.ToString();
    data += entropy;
    return format::HexU32Upper(crypto::Crc32(data));
}

Result<ApiKey> NewApiKey(const std::string& prefix, const std::string& uuid, const Config& config) {
    if (std::optional<Error> invalid = CheckPrefix(prefix)) {
        return std::move(*invalid);
    }
    // The compound format never carries hyphens, whatever config.hyphens() says.
    Result<Key> key = Key::Encode(uuid, false);
    if (!key) {
        return std::move(key).error();
    }
    Result<std::string> entropy = GenerateEntropy(config.entropy());
    if (!entropy) {
        return std::move(entropy).error();
    }
    return ApiKey::Assemble(prefix, std::move(key).value(), std::move(entropy).value());
}

Result<ApiKey> NewApiKey(const std::string& prefix, const std::string& uuid, EntropyClass entropy) {
    return NewApiKey(prefix, uuid, Config::Default().WithEntropy(entropy));
}

Result<ApiKey> NewApiKeyFromBytes(const std::string& prefix, const std::vector<std::uint8_t>& uuid, const Config& config) {
    if (uuid.size() != constants::kUuidByteLength) {
        return Result<ApiKey>::Fail(ErrorCode::InvalidUuidByteLength,
                                    "UUID must be exactly 16 bytes, got " + std::to_string(uuid.size()));
    }
    return NewApiKey(prefix, format::FormatUuid(uuid), config);
}

Result<ApiKey> NewApiKeyFromBytes(const std::string& prefix, const std::vector<std::uint8_t>& uuid, EntropyClass entropy) {
    return NewApiKeyFromBytes(prefix, uuid, Config::Default().WithEntropy(entropy));
}

}  // namespace uuidkey
