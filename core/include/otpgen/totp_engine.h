/**
 * @created 2026-10-19
 * @description TOTP (Time-based One-Time Password) engine
 *
 * Implements RFC 6238 over HMAC-SHA1 with 6-digit codes.
 * Stateless: every call is a pure function of (secret, clock reading).
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace otpgen {
namespace core {

/**
 * Outcome of a code generation
 */
enum class TotpStatus {
    OK = 0,            // code holds a 6-digit code
    EMPTY_KEY = 1,     // secret decoded to zero bytes
    HASH_FAILURE = 2   // HMAC primitive rejected the key or failed
};

/**
 * Tagged generation result
 *
 * Callers that display the result directly use ToDisplayString(),
 * which renders the failure states as "INVALID" and "ERROR".
 */
struct TotpResult {
    TotpStatus status;
    std::string code;  // Empty unless status == OK

    bool Ok() const { return status == TotpStatus::OK; }

    std::string ToDisplayString() const;

    static TotpResult Success(std::string code);
    static TotpResult Failure(TotpStatus status);
};

class TotpEngine {
public:
    using Clock = std::chrono::system_clock;

    /**
     * Generate the code for the current time
     *
     * @param secret Base32-encoded secret
     * @param window_seconds Time step in seconds (RFC 6238 default 30)
     * @return Tagged result
     * @throws std::invalid_argument if window_seconds is 0
     */
    static TotpResult GenerateCode(
        const std::string& secret,
        uint32_t window_seconds = DEFAULT_WINDOW
    );

    /**
     * Generate the code for an explicit clock reading
     *
     * The reading is rounded to the nearest whole second before the
     * counter is computed.
     */
    static TotpResult GenerateCodeAt(
        const std::string& secret,
        Clock::time_point now,
        uint32_t window_seconds = DEFAULT_WINDOW
    );

    /**
     * Generate the code for an explicit time-step counter
     *
     * @param secret Base32-encoded secret
     * @param time_counter Unix timestamp divided by time step
     * @return Tagged result
     */
    static TotpResult GenerateCodeForCounter(
        const std::string& secret,
        uint64_t time_counter
    );

    /**
     * Seconds left in the current window, in [1, window_seconds]
     *
     * A reading exactly on a window boundary returns window_seconds.
     *
     * @throws std::invalid_argument if window_seconds is 0
     */
    static uint32_t TimeRemaining(uint32_t window_seconds = DEFAULT_WINDOW);

    static uint32_t TimeRemainingAt(
        Clock::time_point now,
        uint32_t window_seconds = DEFAULT_WINDOW
    );

    /**
     * floor(round(now) / window_seconds)
     *
     * Readings before the Unix epoch count as 0.
     */
    static uint64_t TimeCounter(Clock::time_point now, uint32_t window_seconds);

    /**
     * Check a user-entered code against the current time ± skew windows
     *
     * @param secret Base32-encoded secret
     * @param code 6-digit code from user
     * @param skew Number of windows to accept on either side (default: 1)
     * @param window_seconds Time step in seconds
     * @return true if code matches any window in range
     */
    static bool VerifyCode(
        const std::string& secret,
        const std::string& code,
        int skew = 1,
        uint32_t window_seconds = DEFAULT_WINDOW
    );

    static bool VerifyCodeAt(
        const std::string& secret,
        const std::string& code,
        Clock::time_point now,
        int skew = 1,
        uint32_t window_seconds = DEFAULT_WINDOW
    );

    /**
     * Serialize a counter as the 8-byte big-endian HMAC message
     */
    static std::vector<uint8_t> EncodeCounter(uint64_t time_counter);

    /**
     * RFC 4226 section 5.3 dynamic truncation of a 20-byte digest
     *
     * @return Non-negative 31-bit integer
     */
    static uint32_t DynamicTruncate(const std::vector<uint8_t>& digest);

    /**
     * Reduce modulo 10^6 and left-pad with '0' to 6 characters
     */
    static std::string FormatCode(uint32_t binary);

    // Time step in seconds (RFC 6238 default)
    static constexpr uint32_t DEFAULT_WINDOW = 30;

    // TOTP code length (6 digits)
    static constexpr int CODE_LENGTH = 6;

    // 10^CODE_LENGTH
    static constexpr uint32_t CODE_MODULUS = 1000000;

    // HMAC-SHA1 output size
    static constexpr size_t DIGEST_LENGTH = 20;

private:
    /**
     * Compute HMAC-SHA1
     *
     * @return 20-byte digest, or nullopt if the primitive failed
     */
    static std::optional<std::vector<uint8_t>> HmacSha1(
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& message
    );

    // Clock reading rounded to whole seconds, clamped at the epoch
    static uint64_t EpochSeconds(Clock::time_point now);

    static void RequireWindow(uint32_t window_seconds);
};

} // namespace core
} // namespace otpgen
