#include <catch2/catch.hpp>
#include <uuidkey/apikey.hpp>
#include <uuidkey/entropy.hpp>
#include <uuidkey/uuidkey.hpp>

#include <set>
#include <sstream>

using namespace uuidkey;

namespace {

const std::string kUuid = "d1756360-5da0-40df-9926-a76abff5601d";
const std::string kApiKey = "MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJ_E4809599";

const char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

bool IsUpperCrockford(const std::string& text) {
    return text.find_first_not_of(kAlphabet) == std::string::npos;
}

}  // namespace

TEST_CASE("NewApiKey defaults to 160-bit entropy", "[apikey]") {
    auto api_key = NewApiKey("MYPREFIX", kUuid);
    REQUIRE(api_key.ok());
    REQUIRE(api_key.value().entropy().size() == 21);
    REQUIRE(api_key.value().entropy_class() == EntropyClass::Bits160);
}

TEST_CASE("NewApiKey entropy length follows the entropy class", "[apikey]") {
    auto api128 = NewApiKey("MYPREFIX", kUuid, EntropyClass::Bits128);
    auto api160 = NewApiKey("MYPREFIX", kUuid, EntropyClass::Bits160);
    auto api256 = NewApiKey("MYPREFIX", kUuid, EntropyClass::Bits256);
    REQUIRE(api128.ok());
    REQUIRE(api160.ok());
    REQUIRE(api256.ok());
    REQUIRE(api128.value().entropy().size() == 14);
    REQUIRE(api160.value().entropy().size() == 21);
    REQUIRE(api256.value().entropy().size() == 42);
    REQUIRE(IsUpperCrockford(api256.value().entropy()));
}

TEST_CASE("NewApiKey stores the key without hyphens", "[apikey]") {
    auto api_key = NewApiKey("MYPREFIX", kUuid, Config::Default().WithHyphens(true));
    REQUIRE(api_key.ok());
    REQUIRE(api_key.value().key().ToString() == "38QARV01ET0G6Z2CJD9VA2ZZAR0X");
    REQUIRE(api_key.value().prefix() == "MYPREFIX");

    const std::string text = api_key.value().ToString();
    REQUIRE(text.size() == 8 + 1 + 28 + 21 + 1 + 8);
    REQUIRE(text.rfind("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0X", 0) == 0);
}

TEST_CASE("NewApiKey rejects an empty prefix", "[apikey]") {
    auto api_key = NewApiKey("", kUuid);
    REQUIRE_FALSE(api_key.ok());
    REQUIRE(api_key.error().code == ErrorCode::EmptyPrefix);
    REQUIRE(api_key.error().message == "prefix cannot be empty");
}

TEST_CASE("NewApiKey rejects a prefix containing the separator", "[apikey]") {
    auto api_key = NewApiKey("MY_APP", kUuid);
    REQUIRE_FALSE(api_key.ok());
    REQUIRE(api_key.error().code == ErrorCode::InvalidPrefix);
    REQUIRE(api_key.error().message == "prefix cannot contain '_'");

    auto key = Key::Parse("38QARV01ET0G6Z2CJD9VA2ZZAR0X");
    REQUIRE(key.ok());
    auto assembled = ApiKey::Assemble("MY_APP", key.value(), "VNBP1HX5VMAJDWWHK7TZJ");
    REQUIRE_FALSE(assembled.ok());
    REQUIRE(assembled.error().code == ErrorCode::InvalidPrefix);
}

TEST_CASE("Every accepted prefix survives a parse", "[apikey][parse]") {
    for (const char* prefix : {"A", "MYPREFIX", "my-app.v2", "PFX 1"}) {
        auto created = NewApiKey(prefix, kUuid, EntropyClass::Bits128);
        REQUIRE(created.ok());
        auto parsed = ApiKey::Parse(created.value().ToString());
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value().prefix() == prefix);
    }
}

TEST_CASE("NewApiKey rejects an invalid UUID", "[apikey]") {
    auto api_key = NewApiKey("MYPREFIX", "d1756360-5da0-40df-9926-a76abff5601");
    REQUIRE_FALSE(api_key.ok());
    REQUIRE(api_key.error().code == ErrorCode::InvalidUuidLength);
    REQUIRE(api_key.error().message == "Invalid UUID length");
}

TEST_CASE("NewApiKey produces fresh entropy each call", "[apikey]") {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        auto api_key = NewApiKey("MYPREFIX", kUuid);
        REQUIRE(api_key.ok());
        REQUIRE(seen.insert(api_key.value().entropy()).second);
    }
}

TEST_CASE("NewApiKeyFromBytes formats the UUID", "[apikey]") {
    std::vector<std::uint8_t> uuid = {0xd1, 0x75, 0x63, 0x60, 0x5d, 0xa0, 0x40, 0xdf,
                                      0x99, 0x26, 0xa7, 0x6a, 0xbf, 0xf5, 0x60, 0x1d};
    auto api_key = NewApiKeyFromBytes("MYPREFIX", uuid);
    REQUIRE(api_key.ok());
    REQUIRE(api_key.value().key().ToString() == "38QARV01ET0G6Z2CJD9VA2ZZAR0X");
    auto decoded = api_key.value().key().ToUuid();
    REQUIRE(decoded.ok());
    REQUIRE(decoded.value() == kUuid);
}

TEST_CASE("NewApiKeyFromBytes rejects wrong byte length", "[apikey]") {
    std::vector<std::uint8_t> short_uuid(15, 0xAB);
    auto api_key = NewApiKeyFromBytes("MYPREFIX", short_uuid, EntropyClass::Bits128);
    REQUIRE_FALSE(api_key.ok());
    REQUIRE(api_key.error().code == ErrorCode::InvalidUuidByteLength);

    auto empty = NewApiKeyFromBytes("MYPREFIX", {});
    REQUIRE_FALSE(empty.ok());
    REQUIRE(empty.error().code == ErrorCode::InvalidUuidByteLength);
}

TEST_CASE("Checksum covers prefix, key and entropy", "[apikey]") {
    auto key = Key::Parse("38QARV01ET0G6Z2CJD9VA2ZZAR0X");
    REQUIRE(key.ok());
    REQUIRE(CalculateChecksum("MYPREFIX", key.value(), "VNBP1HX5VMAJDWWHK7TZJ") == "E4809599");
    REQUIRE(CalculateChecksum("MYPREFIX", key.value(), "") == "462D378E");
    REQUIRE(CalculateChecksum("AGNTSTNP", key.value(), "0123456789ABCD") == "61E5450F");
}

TEST_CASE("Assemble computes the checksum", "[apikey]") {
    auto key = Key::Parse("38QARV01ET0G6Z2CJD9VA2ZZAR0X");
    REQUIRE(key.ok());
    auto api_key = ApiKey::Assemble("MYPREFIX", key.value(), "VNBP1HX5VMAJDWWHK7TZJ");
    REQUIRE(api_key.ok());
    REQUIRE(api_key.value().checksum() == "E4809599");
    REQUIRE(api_key.value().ToString() == kApiKey);

    auto no_prefix = ApiKey::Assemble("", key.value(), "VNBP1HX5VMAJDWWHK7TZJ");
    REQUIRE_FALSE(no_prefix.ok());
    REQUIRE(no_prefix.error().code == ErrorCode::EmptyPrefix);
}

TEST_CASE("Parse reproduces the original text", "[apikey][parse]") {
    auto api_key = ApiKey::Parse(kApiKey);
    REQUIRE(api_key.ok());
    REQUIRE(api_key.value().ToString() == kApiKey);
    REQUIRE(api_key.value().prefix() == "MYPREFIX");
    REQUIRE(api_key.value().key().ToString() == "38QARV01ET0G6Z2CJD9VA2ZZAR0X");
    REQUIRE(api_key.value().entropy() == "VNBP1HX5VMAJDWWHK7TZJ");
    REQUIRE(api_key.value().checksum() == "E4809599");
}

TEST_CASE("Free Parse matches ApiKey::Parse", "[apikey][parse]") {
    auto parsed = uuidkey::Parse(kApiKey);
    auto direct = ApiKey::Parse(kApiKey);
    REQUIRE(parsed.ok());
    REQUIRE(direct.ok());
    REQUIRE(parsed.value() == direct.value());
}

TEST_CASE("Parse accepts what NewApiKey produces", "[apikey][parse]") {
    for (EntropyClass entropy : {EntropyClass::Bits128, EntropyClass::Bits160, EntropyClass::Bits256}) {
        auto created = NewApiKey("AGNTSTNP", kUuid, entropy);
        REQUIRE(created.ok());
        auto parsed = ApiKey::Parse(created.value().ToString());
        REQUIRE(parsed.ok());
        REQUIRE(parsed.value() == created.value());
        REQUIRE(parsed.value().ToString() == created.value().ToString());
        REQUIRE(parsed.value().entropy_class() == entropy);
    }
}

TEST_CASE("Parse accepts entropy of any length", "[apikey][parse]") {
    auto parsed = ApiKey::Parse("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0X_462D378E");
    REQUIRE(parsed.ok());
    REQUIRE(parsed.value().entropy().empty());
    REQUIRE_FALSE(parsed.value().entropy_class().has_value());
}

TEST_CASE("Parse rejects empty input", "[apikey][parse]") {
    auto parsed = ApiKey::Parse("");
    REQUIRE_FALSE(parsed.ok());
    REQUIRE(parsed.error().code == ErrorCode::EmptyInput);
    REQUIRE(parsed.error().message == "invalid APIKey format");
}

TEST_CASE("Parse rejects wrong part count", "[apikey][parse]") {
    auto two = ApiKey::Parse("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJ");
    REQUIRE_FALSE(two.ok());
    REQUIRE(two.error().code == ErrorCode::WrongPartCount);
    REQUIRE(two.error().message == "invalid APIKey format: expected 3 parts, got 2");

    auto four = ApiKey::Parse("MY_PREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJ_E4809599");
    REQUIRE_FALSE(four.ok());
    REQUIRE(four.error().message == "invalid APIKey format: expected 3 parts, got 4");

    auto one = ApiKey::Parse("MYPREFIX");
    REQUIRE_FALSE(one.ok());
    REQUIRE(one.error().message == "invalid APIKey format: expected 3 parts, got 1");
}

TEST_CASE("Parse rejects an empty prefix", "[apikey][parse]") {
    auto parsed = ApiKey::Parse("_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJ_E4809523");
    REQUIRE_FALSE(parsed.ok());
    REQUIRE(parsed.error().code == ErrorCode::EmptyPrefix);
    REQUIRE(parsed.error().message == "invalid prefix: cannot be empty");
}

TEST_CASE("Parse rejects a short key segment", "[apikey][parse]") {
    auto parsed = ApiKey::Parse("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0_E4809599");
    REQUIRE_FALSE(parsed.ok());
    REQUIRE(parsed.error().code == ErrorCode::InsufficientLength);
    REQUIRE(parsed.error().message == "invalid Key format: insufficient length");
}

TEST_CASE("Parse rejects malformed checksums", "[apikey][parse]") {
    auto too_long = ApiKey::Parse("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJJ_E480952332");
    REQUIRE_FALSE(too_long.ok());
    REQUIRE(too_long.error().code == ErrorCode::InvalidChecksumFormat);
    REQUIRE(too_long.error().message == "invalid checksum format: must be 8 hexadecimal characters");

    auto lower = ApiKey::Parse("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJ_e4809599");
    REQUIRE_FALSE(lower.ok());
    REQUIRE(lower.error().code == ErrorCode::InvalidChecksumFormat);

    auto not_hex = ApiKey::Parse("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJ_E480959G");
    REQUIRE_FALSE(not_hex.ok());
    REQUIRE(not_hex.error().code == ErrorCode::InvalidChecksumFormat);
}

TEST_CASE("Parse rejects an invalid key segment", "[apikey][parse]") {
    auto parsed = ApiKey::Parse("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZARUXVNBP1HX5VMAJDWWHK7TZJ_E4809599");
    REQUIRE_FALSE(parsed.ok());
    REQUIRE(parsed.error().code == ErrorCode::InvalidKeyFormat);
}

TEST_CASE("Parse rejects a checksum mismatch", "[apikey][parse]") {
    auto parsed = ApiKey::Parse("MYPREFIX_38QARV01ET0G6Z2CJD9VA2ZZAR0XVNBP1HX5VMAJDWWHK7TZJJ_E4809523");
    REQUIRE_FALSE(parsed.ok());
    REQUIRE(parsed.error().code == ErrorCode::ChecksumMismatch);
    REQUIRE_THAT(parsed.error().message, Catch::Matchers::StartsWith("invalid checksum: expected "));
    REQUIRE_THAT(parsed.error().message, Catch::Matchers::EndsWith(", got E4809523"));
}

TEST_CASE("Parse fails when any single character changes", "[apikey][parse]") {
    for (std::size_t i = 0; i < kApiKey.size(); ++i) {
        if (kApiKey[i] == '_') {
            continue;
        }
        std::string tampered = kApiKey;
        tampered[i] = tampered[i] == 'A' ? 'B' : 'A';
        auto parsed = ApiKey::Parse(tampered);
        INFO("position " << i << ": " << tampered);
        REQUIRE_FALSE(parsed.ok());
    }
}

TEST_CASE("ApiKey streams as its text form", "[apikey]") {
    auto api_key = ApiKey::Parse(kApiKey);
    REQUIRE(api_key.ok());
    std::ostringstream out;
    out << api_key.value() << " " << api_key.value().key();
    REQUIRE(out.str() == kApiKey + " 38QARV01ET0G6Z2CJD9VA2ZZAR0X");
}

TEST_CASE("Entropy digest encoding is truncated or zero padded", "[entropy]") {
    crypto::Bytes ones(crypto::kSha256Length, 0xFF);
    REQUIRE(EncodeEntropyDigest(ones, EntropyClass::Bits128) == "1" + std::string(13, 'Z'));
    REQUIRE(EncodeEntropyDigest(ones, EntropyClass::Bits256) == "1" + std::string(41, 'Z'));

    crypto::Bytes zeros(crypto::kSha256Length, 0x00);
    REQUIRE(EncodeEntropyDigest(zeros, EntropyClass::Bits256) == std::string(42, '0'));
    REQUIRE(EncodeEntropyDigest(zeros, EntropyClass::Bits160) == std::string(21, '0'));
}

TEST_CASE("Entropy generator lengths and alphabet", "[entropy]") {
    REQUIRE(EntropySourceBytes(EntropyClass::Bits128) == 23);
    REQUIRE(EntropySourceBytes(EntropyClass::Bits160) == 34);
    REQUIRE(EntropySourceBytes(EntropyClass::Bits256) == 68);

    for (EntropyClass entropy : {EntropyClass::Bits128, EntropyClass::Bits160, EntropyClass::Bits256}) {
        auto generated = GenerateEntropy(entropy);
        REQUIRE(generated.ok());
        REQUIRE(generated.value().size() == EntropyLength(entropy));
        REQUIRE(IsUpperCrockford(generated.value()));
    }
}
