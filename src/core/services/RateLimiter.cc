// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "RateLimiter.h"
#include "IdentifierHashService.h"
#include "../../utils/Log.h"

#include <algorithm>
#include <stdexcept>

namespace AuthKeep {

RateLimiter::RateLimiter(IRateLimitRepository* repository, const IClock* clock,
                         RateLimitPolicies policies)
    : m_repository(repository)
    , m_clock(clock)
    , m_policies(policies) {
    if (!m_repository) {
        throw std::invalid_argument("RateLimiter: repository cannot be null");
    }
    if (!m_clock) {
        throw std::invalid_argument("RateLimiter: clock cannot be null");
    }
}

AuthResult<RateLimitDecision> RateLimiter::check_and_consume(
    std::string_view key,
    uint32_t limit,
    std::chrono::milliseconds window) {

    const TimePoint now = m_clock->now();
    auto counter = m_repository->increment_counter(key, window.count(), to_epoch_ms(now));
    if (!counter) {
        Log::error("RateLimiter: failed to update counter {}: {}", key, to_string(counter.error()));
        return std::unexpected(to_auth_error(counter.error()));
    }

    RateLimitDecision decision;
    decision.allowed = counter->count() <= limit;
    decision.remaining = limit - std::min(counter->count(), limit);
    decision.reset_time = from_epoch_ms(counter->window_start() + window.count());

    if (!decision.allowed) {
        // Round up so a client waiting retry_after never arrives early
        const auto wait = std::chrono::ceil<std::chrono::seconds>(decision.reset_time - now);
        decision.retry_after = std::max(wait, std::chrono::seconds{1});
        Log::debug("RateLimiter: {} over limit ({} > {}), retry in {}s",
                   key, counter->count(), limit, decision.retry_after.count());
    }
    return decision;
}

AuthResult<RateLimitDecision> RateLimiter::check(RateLimitScope scope, std::string_view subject) {
    auto key = make_key(scope, subject);
    if (!key) {
        return std::unexpected(key.error());
    }
    const auto& policy = m_policies.for_scope(scope);
    return check_and_consume(*key, policy.limit, policy.window);
}

AuthResult<std::string> RateLimiter::make_key(RateLimitScope scope, std::string_view subject) {
    auto digest = IdentifierHashService::sha256_hex(subject);
    if (!digest) {
        return std::unexpected(digest.error());
    }
    std::string key(to_string(scope));
    key += ':';
    key += *digest;
    return key;
}

AuthResult<size_t> RateLimiter::cleanup_expired() {
    auto removed = m_repository->delete_expired_counters(to_epoch_ms(m_clock->now()));
    if (!removed) {
        Log::error("RateLimiter: cleanup failed: {}", to_string(removed.error()));
        return std::unexpected(to_auth_error(removed.error()));
    }
    if (*removed > 0) {
        Log::debug("RateLimiter: purged {} expired counters", *removed);
    }
    return *removed;
}

} // namespace AuthKeep
