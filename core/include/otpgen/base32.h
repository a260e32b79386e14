/**
 * @created 2026-10-19
 * @description RFC 4648 Base32 codec for TOTP shared secrets
 *
 * Decoding is lenient (characters outside the alphabet are skipped),
 * validation is strict. The two are separate on purpose: validation runs
 * when a secret is accepted, decoding runs on whatever reaches the engine.
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace otpgen {
namespace core {

class Base32 {
public:
    /**
     * Decode a human-entered Base32 string to raw bytes
     *
     * Input is uppercased, whitespace is removed and trailing '=' padding
     * is stripped. Characters outside A-Z / 2-7 are skipped silently.
     *
     * @param input Base32 text, any case, possibly space separated
     * @return Decoded bytes; empty when no alphabet character was found
     */
    static std::vector<uint8_t> Decode(const std::string& input);

    /**
     * Encode raw bytes as uppercase Base32, '=' padded to a multiple of 8
     *
     * @param data Raw bytes
     * @return Base32-encoded string
     */
    static std::string Encode(const std::vector<uint8_t>& data);

    /**
     * Strict check: after removing whitespace, the string must match
     * ^[A-Z2-7]+=*$ case-insensitively. Empty input is invalid.
     *
     * @param input Candidate secret
     * @return true if the secret is acceptable
     */
    static bool IsValid(const std::string& input);

    /**
     * Remove all whitespace and uppercase the rest
     *
     * Used to store accepted secrets in a canonical form.
     */
    static std::string Clean(const std::string& input);

    // RFC 4648 alphabet, index is the 5-bit value
    static constexpr const char* ALPHABET = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

private:
    // Returns the 5-bit value of an uppercase character, or -1
    static int CharValue(char c);
};

} // namespace core
} // namespace otpgen
