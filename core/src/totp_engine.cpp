/**
 * @created 2026-10-19
 * @description TOTP engine implementation
 */

#include "otpgen/totp_engine.h"
#include "otpgen/base32.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <openssl/sha.h>
#include <algorithm>
#include <climits>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace otpgen {
namespace core {

std::string TotpResult::ToDisplayString() const {
    switch (status) {
        case TotpStatus::OK:
            return code;
        case TotpStatus::EMPTY_KEY:
            return "INVALID";
        case TotpStatus::HASH_FAILURE:
            return "ERROR";
    }
    return "ERROR";
}

TotpResult TotpResult::Success(std::string code) {
    return TotpResult{TotpStatus::OK, std::move(code)};
}

TotpResult TotpResult::Failure(TotpStatus status) {
    return TotpResult{status, std::string()};
}

TotpResult TotpEngine::GenerateCode(const std::string& secret, uint32_t window_seconds) {
    return GenerateCodeAt(secret, Clock::now(), window_seconds);
}

TotpResult TotpEngine::GenerateCodeAt(
    const std::string& secret,
    Clock::time_point now,
    uint32_t window_seconds
) {
    return GenerateCodeForCounter(secret, TimeCounter(now, window_seconds));
}

TotpResult TotpEngine::GenerateCodeForCounter(const std::string& secret, uint64_t time_counter) {
    auto key = Base32::Decode(secret);
    if (key.empty()) {
        return TotpResult::Failure(TotpStatus::EMPTY_KEY);
    }

    auto hmac = HmacSha1(key, EncodeCounter(time_counter));
    if (!hmac) {
        std::cerr << "ERROR: TOTP generation failed: HMAC-SHA1 rejected a "
                  << key.size() << "-byte key" << std::endl;
        return TotpResult::Failure(TotpStatus::HASH_FAILURE);
    }

    return TotpResult::Success(FormatCode(DynamicTruncate(*hmac)));
}

uint32_t TotpEngine::TimeRemaining(uint32_t window_seconds) {
    return TimeRemainingAt(Clock::now(), window_seconds);
}

uint32_t TotpEngine::TimeRemainingAt(Clock::time_point now, uint32_t window_seconds) {
    RequireWindow(window_seconds);
    return window_seconds - static_cast<uint32_t>(EpochSeconds(now) % window_seconds);
}

uint64_t TotpEngine::TimeCounter(Clock::time_point now, uint32_t window_seconds) {
    RequireWindow(window_seconds);
    return EpochSeconds(now) / window_seconds;
}

bool TotpEngine::VerifyCode(
    const std::string& secret,
    const std::string& code,
    int skew,
    uint32_t window_seconds
) {
    return VerifyCodeAt(secret, code, Clock::now(), skew, window_seconds);
}

bool TotpEngine::VerifyCodeAt(
    const std::string& secret,
    const std::string& code,
    Clock::time_point now,
    int skew,
    uint32_t window_seconds
) {
    if (code.length() != static_cast<size_t>(CODE_LENGTH)) {
        return false;
    }

    // Verify code contains only digits
    if (!std::all_of(code.begin(), code.end(),
                     [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }

    uint64_t current_counter = TimeCounter(now, window_seconds);
    skew = std::max(skew, 0);

    // Check code against current counter ± skew
    for (int i = -skew; i <= skew; ++i) {
        if (i < 0 && static_cast<uint64_t>(-i) > current_counter) {
            continue;
        }
        uint64_t test_counter = i < 0
            ? current_counter - static_cast<uint64_t>(-i)
            : current_counter + static_cast<uint64_t>(i);

        TotpResult expected = GenerateCodeForCounter(secret, test_counter);
        if (!expected.Ok()) {
            return false;
        }

        if (CRYPTO_memcmp(code.data(), expected.code.data(), CODE_LENGTH) == 0) {
            return true;
        }
    }

    return false;
}

std::vector<uint8_t> TotpEngine::EncodeCounter(uint64_t time_counter) {
    // Full 8-byte field even though the high half is zero until 2106
    std::vector<uint8_t> message(8);
    for (int i = 7; i >= 0; --i) {
        message[i] = static_cast<uint8_t>(time_counter & 0xFF);
        time_counter >>= 8;
    }
    return message;
}

uint32_t TotpEngine::DynamicTruncate(const std::vector<uint8_t>& digest) {
    if (digest.size() < DIGEST_LENGTH) {
        throw std::invalid_argument("HMAC-SHA1 digest must be 20 bytes");
    }

    size_t offset = digest[DIGEST_LENGTH - 1] & 0x0F;
    return (static_cast<uint32_t>(digest[offset] & 0x7F) << 24)
         | (static_cast<uint32_t>(digest[offset + 1]) << 16)
         | (static_cast<uint32_t>(digest[offset + 2]) << 8)
         | static_cast<uint32_t>(digest[offset + 3]);
}

std::string TotpEngine::FormatCode(uint32_t binary) {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(CODE_LENGTH) << (binary % CODE_MODULUS);
    return ss.str();
}

// Private methods

std::optional<std::vector<uint8_t>> TotpEngine::HmacSha1(
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& message
) {
    if (key.size() > static_cast<size_t>(INT_MAX)) {
        return std::nullopt;
    }

    unsigned char result[EVP_MAX_MD_SIZE];
    unsigned int result_len = 0;

    unsigned char* digest = HMAC(EVP_sha1(),
                                 key.data(), static_cast<int>(key.size()),
                                 message.data(), message.size(),
                                 result, &result_len);
    if (digest == nullptr || result_len != SHA_DIGEST_LENGTH) {
        return std::nullopt;
    }

    return std::vector<uint8_t>(result, result + result_len);
}

uint64_t TotpEngine::EpochSeconds(Clock::time_point now) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count();
    if (millis < 0) {
        return 0;
    }

    // Round half up to the nearest second
    return static_cast<uint64_t>((millis + 500) / 1000);
}

void TotpEngine::RequireWindow(uint32_t window_seconds) {
    if (window_seconds == 0) {
        throw std::invalid_argument("TOTP window length must be positive");
    }
}

} // namespace core
} // namespace otpgen
