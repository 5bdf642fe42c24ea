#include "uuidkey/crockford.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace uuidkey::crockford {

namespace {

constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

std::array<int, 256> BuildDecodeTable() {
    std::array<int, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 32; ++i) {
        table[static_cast<unsigned char>(kAlphabet[i])] = i;
        table[static_cast<unsigned char>(std::tolower(kAlphabet[i]))] = i;
    }
    return table;
}

const std::array<int, 256> kDecodeTable = BuildDecodeTable();

}  // namespace

bool IsSymbol(char ch) {
    return kDecodeTable[static_cast<unsigned char>(ch)] >= 0;
}

std::string Encode(const std::vector<std::uint8_t>& data) {
    if (data.empty()) {
        return "";
    }
    // Symbols are produced least significant first and reversed at the end.
    std::string out;
    out.reserve((data.size() * 8 + 4) / 5);
    std::uint32_t buffer = 0;
    int bits = 0;
    for (auto it = data.rbegin(); it != data.rend(); ++it) {
        buffer |= static_cast<std::uint32_t>(*it) << bits;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kAlphabet[buffer & 0x1F]);
            buffer >>= 5;
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kAlphabet[buffer & 0x1F]);
    }
    while (!out.empty() && out.back() == '0') {
        out.pop_back();
    }
    auto zero_bytes = std::find_if(data.begin(), data.end(), [](std::uint8_t b) { return b != 0; }) - data.begin();
    out.append(static_cast<std::size_t>(zero_bytes), kAlphabet[0]);
    std::reverse(out.begin(), out.end());
    return out;
}

std::vector<std::uint8_t> Decode(const std::string& input, bool* ok) {
    bool success = true;
    std::vector<std::uint8_t> out;
    out.reserve((input.size() * 5) / 8 + 1);
    std::uint32_t buffer = 0;
    int bits = 0;

    for (auto it = input.rbegin(); it != input.rend(); ++it) {
        int val = kDecodeTable[static_cast<unsigned char>(*it)];
        if (val < 0) {
            success = false;
            break;
        }
        buffer |= static_cast<std::uint32_t>(val) << bits;
        bits += 5;
        if (bits >= 8) {
            out.push_back(static_cast<std::uint8_t>(buffer & 0xFF));
            buffer >>= 8;
            bits -= 8;
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
        return out;
    }
    if (bits > 0 && buffer != 0) {
        out.push_back(static_cast<std::uint8_t>(buffer & 0xFF));
    }
    while (!out.empty() && out.back() == 0) {
        out.pop_back();
    }
    std::size_t zero_symbols = input.find_first_not_of(kAlphabet[0]);
    if (zero_symbols == std::string::npos) {
        zero_symbols = input.size();
    }
    out.insert(out.end(), zero_symbols, 0);
    std::reverse(out.begin(), out.end());
    return out;
}

}  // namespace uuidkey::crockford
