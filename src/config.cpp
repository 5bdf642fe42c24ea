#include "uuidkey/config.hpp"

#include "uuidkey/constants.hpp"
#include "uuidkey/env.hpp"
#include "uuidkey/log.hpp"

#include <initializer_list>
#include <string>

namespace uuidkey {

std::size_t EntropyLength(EntropyClass entropy) noexcept {
    switch (entropy) {
        case EntropyClass::Bits128:
            return 14;
        case EntropyClass::Bits160:
            return 21;
        case EntropyClass::Bits256:
            return 42;
    }
    return 21;
}

int EntropyBitCount(EntropyClass entropy) noexcept {
    switch (entropy) {
        case EntropyClass::Bits128:
            return 128;
        case EntropyClass::Bits160:
            return 160;
        case EntropyClass::Bits256:
            return 256;
    }
    return 160;
}

const char* EntropyClassName(EntropyClass entropy) noexcept {
    switch (entropy) {
        case EntropyClass::Bits128:
            return "128-bit";
        case EntropyClass::Bits160:
            return "160-bit";
        case EntropyClass::Bits256:
            return "256-bit";
    }
    return "unknown";
}

std::optional<EntropyClass> EntropyClassFromBits(long bits) {
    switch (bits) {
        case 128:
            return EntropyClass::Bits128;
        case 160:
            return EntropyClass::Bits160;
        case 256:
            return EntropyClass::Bits256;
        default:
            return std::nullopt;
    }
}

std::optional<EntropyClass> EntropyClassFromLength(std::size_t length) {
    for (EntropyClass entropy : {EntropyClass::Bits128, EntropyClass::Bits160, EntropyClass::Bits256}) {
        if (EntropyLength(entropy) == length) {
            return entropy;
        }
    }
    return std::nullopt;
}

Config Config::FromEnvironment() {
    Config config = Default();
    config = config.WithHyphens(env::IsEnabled(constants::kEnvHyphens, config.hyphens()));

    std::string raw = env::Get(constants::kEnvEntropyBits);
    if (raw.empty()) {
        return config;
    }
    std::optional<long> bits = env::GetInteger(constants::kEnvEntropyBits);
    std::optional<EntropyClass> entropy = bits ? EntropyClassFromBits(*bits) : std::nullopt;
    if (!entropy) {
        log::Warn(std::string(constants::kEnvEntropyBits) + "=" + raw
                  + " is not one of 128, 160, 256; using " + EntropyClassName(config.entropy()));
        return config;
    }
    return config.WithEntropy(*entropy);
}

}  // namespace uuidkey
