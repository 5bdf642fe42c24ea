#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "uuidkey/config.hpp"
#include "uuidkey/error.hpp"
#include "uuidkey/key.hpp"

namespace uuidkey {

// A compound, secret-scanner friendly API key:
//
//   [Prefix]_[Key][Entropy]_[Checksum]
//
//   MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJ_E4809599
//   └──────┘ └──────────────────────────┘└───────────────────┘ └──────┘
//    Prefix        Key (28 symbols)       Entropy (14/21/42)   CRC32
//
// The Key is always stored without hyphens. Key and entropy share one
// underscore-delimited field and are split by the Key's fixed width.
class ApiKey {
public:
    // Checks the prefix, then computes the checksum.
    static Result<ApiKey> Assemble(std::string prefix, Key key, std::string entropy);

    // Validates `text` and verifies its checksum.
    static Result<ApiKey> Parse(const std::string& text);

    const std::string& prefix() const noexcept { return prefix_; }
    const Key& key() const noexcept { return key_; }
    const std::string& entropy() const noexcept { return entropy_; }
    const std::string& checksum() const noexcept { return checksum_; }

    // The class whose length matches the entropy segment. Parsing accepts
    // entropy of any length, so this may be empty for a valid key.
    std::optional<EntropyClass> entropy_class() const;

    std::string ToString() const;

    bool operator==(const ApiKey& other) const noexcept;
    bool operator!=(const ApiKey& other) const noexcept { return !(*this == other); }

private:
    ApiKey(std::string prefix, Key key, std::string entropy, std::string checksum);

    std::string prefix_;
    Key key_;
    std::string entropy_;
    std::string checksum_;
};

std::ostream& operator<<(std::ostream& os, const ApiKey& api_key);

// CRC32 of prefix + "_" + key + entropy as eight upper-case hex digits.
std::string CalculateChecksum(const std::string& prefix, const Key& key, const std::string& entropy);

Result<ApiKey> NewApiKey(const std::string& prefix, const std::string& uuid, const Config& config);
Result<ApiKey> NewApiKey(const std::string& prefix,
                         const std::string& uuid,
                         EntropyClass entropy = EntropyClass::Bits160);

// `uuid` must hold exactly 16 bytes.
Result<ApiKey> NewApiKeyFromBytes(const std::string& prefix, const std::vector<std::uint8_t>& uuid, const Config& config);
Result<ApiKey> NewApiKeyFromBytes(const std::string& prefix,
                                  const std::vector<std::uint8_t>& uuid,
                                  EntropyClass entropy = EntropyClass::Bits160);

}  // namespace uuidkey
