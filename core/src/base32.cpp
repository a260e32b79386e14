/**
 * @created 2026-10-19
 * @description Base32 codec implementation
 */

#include "otpgen/base32.h"
#include <algorithm>
#include <cctype>
#include <iterator>

namespace otpgen {
namespace core {

namespace {

bool IsSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

char ToUpper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

} // namespace

int Base32::CharValue(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= '2' && c <= '7') {
        return 26 + (c - '2');
    }
    return -1;
}

std::string Base32::Clean(const std::string& input) {
    std::string result;
    result.reserve(input.size());

    for (char c : input) {
        if (IsSpace(c)) {
            continue;
        }
        result += ToUpper(c);
    }

    return result;
}

std::vector<uint8_t> Base32::Decode(const std::string& input) {
    std::string normalized = Clean(input);

    // Strip trailing padding
    size_t end = normalized.find_last_not_of('=');
    normalized.erase(end == std::string::npos ? 0 : end + 1);

    // Capacity hint only, skipped characters produce no output
    std::vector<uint8_t> result;
    result.reserve(normalized.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits_left = 0;

    for (char c : normalized) {
        int value = CharValue(c);
        if (value < 0) {
            continue;  // Lenient: skip anything outside the alphabet
        }

        // Only the low bits_left bits are ever read back
        buffer = ((buffer << 5) | static_cast<uint32_t>(value)) & 0xFFFF;
        bits_left += 5;

        if (bits_left >= 8) {
            result.push_back(static_cast<uint8_t>((buffer >> (bits_left - 8)) & 0xFF));
            bits_left -= 8;
        }
    }

    return result;
}

std::string Base32::Encode(const std::vector<uint8_t>& data) {
    std::string result;
    result.reserve((data.size() + 4) / 5 * 8);

    uint32_t buffer = 0;
    int bits_left = 0;

    for (uint8_t byte : data) {
        buffer = ((buffer << 8) | byte) & 0xFFFF;
        bits_left += 8;

        while (bits_left >= 5) {
            result += ALPHABET[(buffer >> (bits_left - 5)) & 0x1F];
            bits_left -= 5;
        }
    }

    // Handle remaining bits
    if (bits_left > 0) {
        result += ALPHABET[(buffer << (5 - bits_left)) & 0x1F];
    }

    while (result.length() % 8 != 0) {
        result += '=';
    }

    return result;
}

bool Base32::IsValid(const std::string& input) {
    std::string stripped;
    stripped.reserve(input.size());
    std::copy_if(input.begin(), input.end(), std::back_inserter(stripped),
                 [](char c) { return !IsSpace(c); });

    if (stripped.empty()) {
        return false;
    }

    // ^[A-Z2-7]+=*$
    size_t i = 0;
    while (i < stripped.size() && CharValue(ToUpper(stripped[i])) >= 0) {
        ++i;
    }
    if (i == 0) {
        return false;
    }

    return std::all_of(stripped.begin() + i, stripped.end(),
                       [](char c) { return c == '='; });
}

} // namespace core
} // namespace otpgen
