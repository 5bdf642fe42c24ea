#include "uuidkey/format.hpp"

#include "uuidkey/constants.hpp"

#include <stdexcept>

namespace uuidkey::format {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";
constexpr char kHexUpper[] = "0123456789ABCDEF";

int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

bool IsUuidHyphenIndex(std::size_t idx) {
    return idx == 8 || idx == 13 || idx == 18 || idx == 23;
}

}  // namespace

std::string HexEncode(const Bytes& data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (std::uint8_t byte : data) {
        out.push_back(kHexLower[(byte >> 4) & 0x0F]);
        out.push_back(kHexLower[byte & 0x0F]);
    }
    return out;
}

Bytes HexDecode(const std::string& input, bool* ok) {
    Bytes out;
    bool success = input.size() % 2 == 0;
    if (success) {
        out.reserve(input.size() / 2);
        for (std::size_t i = 0; i < input.size(); i += 2) {
            int hi = HexValue(input[i]);
            int lo = HexValue(input[i + 1]);
            if (hi < 0 || lo < 0) {
                success = false;
                break;
            }
            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }
    }
    if (ok) {
        *ok = success;
    }
    if (!success) {
        out.clear();
    }
    return out;
}

std::string HexU32Upper(std::uint32_t value) {
    std::string out(8, '0');
    for (int i = 7; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = kHexUpper[value & 0x0F];
        value >>= 4;
    }
    return out;
}

Bytes FitBigEndian(const Bytes& data, std::size_t width, bool* ok) {
    std::size_t first = 0;
    while (first < data.size() && data[first] == 0) {
        ++first;
    }
    std::size_t significant = data.size() - first;
    if (significant > width) {
        if (ok) {
            *ok = false;
        }
        return {};
    }
    Bytes out(width - significant, 0);
    out.insert(out.end(), data.begin() + static_cast<std::ptrdiff_t>(first), data.end());
    if (ok) {
        *ok = true;
    }
    return out;
}

std::string FormatUuid(const Bytes& bytes) {
    if (bytes.size() != constants::kUuidByteLength) {
        throw std::invalid_argument("UUID must be exactly 16 bytes");
    }
    std::string hex = HexEncode(bytes);
    std::string out;
    out.reserve(constants::kUuidLength);
    out.append(hex, 0, 8);
    out.push_back('-');
    out.append(hex, 8, 4);
    out.push_back('-');
    out.append(hex, 12, 4);
    out.push_back('-');
    out.append(hex, 16, 4);
    out.push_back('-');
    out.append(hex, 20, 12);
    return out;
}

bool IsUuidText(const std::string& text) {
    if (text.size() != constants::kUuidLength) {
        return false;
    }
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (IsUuidHyphenIndex(i)) {
            if (text[i] != '-') {
                return false;
            }
        } else if (HexValue(text[i]) < 0) {
            return false;
        }
    }
    return true;
}

}  // namespace uuidkey::format
