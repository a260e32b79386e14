/**
 * @created 2026-10-19
 * @description Per-window code refresh for a set of tracked secrets
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>
#include "totp_engine.h"

namespace otpgen {
namespace core {

/**
 * A labelled secret, stored cleaned (no whitespace, uppercase)
 */
struct TrackedSecret {
    std::string label;
    std::string secret;
};

/**
 * One refreshed code
 */
struct TrackedCode {
    std::string label;
    TotpResult result;
    uint32_t time_remaining;
};

/**
 * Fans out code generation over tracked secrets
 *
 * Secrets are validated when tracked; generation itself still tolerates
 * anything. Results are cached per (secret, counter) and the cache is
 * dropped when the counter advances.
 *
 * Not thread-safe. Callers sharing one instance must lock externally.
 *
 * Usage:
 *   CodeRefresher refresher;
 *   refresher.Track("GitHub", "JBSW Y3DP EHPK 3PXP");
 *   for (const auto& entry : refresher.Refresh()) { ... }
 */
class CodeRefresher {
public:
    explicit CodeRefresher(uint32_t window_seconds = TotpEngine::DEFAULT_WINDOW);

    /**
     * Start tracking a secret
     *
     * @param label Display label (e.g., issuer name), must be unique and non-empty
     * @param secret Base32 secret as entered
     * @return false if the label is empty or taken, or the secret fails Base32::IsValid
     */
    bool Track(const std::string& label, const std::string& secret);

    /**
     * Stop tracking a label
     *
     * @return false if the label was not tracked
     */
    bool Untrack(const std::string& label);

    const std::vector<TrackedSecret>& Secrets() const { return secrets_; }

    size_t Size() const { return secrets_.size(); }

    uint32_t WindowSeconds() const { return window_seconds_; }

    /**
     * True when now falls on the first second of a window
     */
    bool IsNewWindow(TotpEngine::Clock::time_point now) const;

    /**
     * True when no refresh has happened yet in now's window
     */
    bool NeedsRefresh(TotpEngine::Clock::time_point now) const;

    /**
     * Generate codes for every tracked secret, in tracking order
     */
    std::vector<TrackedCode> Refresh(TotpEngine::Clock::time_point now);

    std::vector<TrackedCode> Refresh();

private:
    uint32_t window_seconds_;
    std::vector<TrackedSecret> secrets_;

    // Results for cached_counter_, keyed by cleaned secret
    std::map<std::string, TotpResult> cache_;
    std::optional<uint64_t> cached_counter_;
};

} // namespace core
} // namespace otpgen
