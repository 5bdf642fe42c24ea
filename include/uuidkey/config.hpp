#pragma once

#include <cstddef>
#include <optional>

namespace uuidkey {

// How much random material accompanies a Key in an ApiKey. Each class maps to
// the number of Base32-Crockford symbols needed to carry that many bits.
enum class EntropyClass {
    Bits128,
    Bits160,
    Bits256,
};

// Symbols in the entropy segment: 14, 21 or 42.
std::size_t EntropyLength(EntropyClass entropy) noexcept;
// Nominal strength: 128, 160 or 256.
int EntropyBitCount(EntropyClass entropy) noexcept;
const char* EntropyClassName(EntropyClass entropy) noexcept;

std::optional<EntropyClass> EntropyClassFromBits(long bits);
std::optional<EntropyClass> EntropyClassFromLength(std::size_t length);

// Immutable construction parameters for an ApiKey.
class Config {
public:
    constexpr Config() = default;
    constexpr Config(bool hyphens, EntropyClass entropy) : hyphens_(hyphens), entropy_(entropy) {}

    // hyphens=true, entropy=Bits160
    static constexpr Config Default() { return Config(); }

    // Default() overridden by UUIDKEY_HYPHENS and UUIDKEY_ENTROPY_BITS.
    static Config FromEnvironment();

    constexpr Config WithHyphens(bool hyphens) const { return Config(hyphens, entropy_); }
    constexpr Config WithEntropy(EntropyClass entropy) const { return Config(hyphens_, entropy); }

    // Recorded for callers; the compound format always stores the Key without hyphens.
    constexpr bool hyphens() const noexcept { return hyphens_; }
    constexpr EntropyClass entropy() const noexcept { return entropy_; }

    constexpr bool operator==(const Config& other) const noexcept {
        return hyphens_ == other.hyphens_ && entropy_ == other.entropy_;
    }
    constexpr bool operator!=(const Config& other) const noexcept { return !(*this == other); }

private:
    bool hyphens_ = true;
    EntropyClass entropy_ = EntropyClass::Bits160;
};

}  // namespace uuidkey
