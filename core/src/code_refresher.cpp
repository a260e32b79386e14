/**
 * @created 2026-10-19
 * @description Code refresher implementation
 */

#include "otpgen/code_refresher.h"
#include "otpgen/base32.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace otpgen {
namespace core {

CodeRefresher::CodeRefresher(uint32_t window_seconds)
    : window_seconds_(window_seconds) {
    if (window_seconds_ == 0) {
        throw std::invalid_argument("TOTP window length must be positive");
    }
}

bool CodeRefresher::Track(const std::string& label, const std::string& secret) {
    if (label.empty()) {
        std::cerr << "WARNING: Refusing to track a secret without a label" << std::endl;
        return false;
    }

    auto existing = std::find_if(secrets_.begin(), secrets_.end(),
        [&label](const TrackedSecret& tracked) { return tracked.label == label; });
    if (existing != secrets_.end()) {
        std::cerr << "WARNING: Label already tracked: " << label << std::endl;
        return false;
    }

    std::string cleaned = Base32::Clean(secret);
    if (!Base32::IsValid(cleaned)) {
        std::cerr << "WARNING: Invalid Base32 secret for " << label << std::endl;
        return false;
    }

    secrets_.push_back(TrackedSecret{label, cleaned});
    std::cout << "Tracking " << label << std::endl;
    return true;
}

bool CodeRefresher::Untrack(const std::string& label) {
    auto it = std::find_if(secrets_.begin(), secrets_.end(),
        [&label](const TrackedSecret& tracked) { return tracked.label == label; });
    if (it == secrets_.end()) {
        return false;
    }

    // Another label may share the secret, so only drop unshared cache entries
    std::string secret = it->secret;
    secrets_.erase(it);
    bool shared = std::any_of(secrets_.begin(), secrets_.end(),
        [&secret](const TrackedSecret& tracked) { return tracked.secret == secret; });
    if (!shared) {
        cache_.erase(secret);
    }

    std::cout << "Stopped tracking " << label << std::endl;
    return true;
}

bool CodeRefresher::IsNewWindow(TotpEngine::Clock::time_point now) const {
    return TotpEngine::TimeRemainingAt(now, window_seconds_) == window_seconds_;
}

bool CodeRefresher::NeedsRefresh(TotpEngine::Clock::time_point now) const {
    return !cached_counter_ ||
           *cached_counter_ != TotpEngine::TimeCounter(now, window_seconds_);
}

std::vector<TrackedCode> CodeRefresher::Refresh(TotpEngine::Clock::time_point now) {
    uint64_t counter = TotpEngine::TimeCounter(now, window_seconds_);
    uint32_t remaining = TotpEngine::TimeRemainingAt(now, window_seconds_);

    if (!cached_counter_ || *cached_counter_ != counter) {
        cache_.clear();
        cached_counter_ = counter;
    }

    std::vector<TrackedCode> codes;
    codes.reserve(secrets_.size());

    for (const auto& tracked : secrets_) {
        auto cached = cache_.find(tracked.secret);
        if (cached == cache_.end()) {
            // A failure for one secret must not stop the others
            TotpResult result = TotpEngine::GenerateCodeForCounter(tracked.secret, counter);
            cached = cache_.emplace(tracked.secret, result).first;
        }
        codes.push_back(TrackedCode{tracked.label, cached->second, remaining});
    }

    return codes;
}

std::vector<TrackedCode> CodeRefresher::Refresh() {
    return Refresh(TotpEngine::Clock::now());
}

} // namespace core
} // namespace otpgen
