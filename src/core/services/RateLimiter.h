// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file RateLimiter.h
 * @brief Fixed-window rate limiting for OTP initiation and verification
 *
 * Counters are kept in an IRateLimitRepository, which performs the
 * increment atomically, so several service instances sharing one store
 * see one consistent count per key.
 *
 * Keys have the form "<scope>:<sha256 hex of subject>"; raw IP addresses,
 * identifiers and session ids never reach the store.
 */

#pragma once

#include "../AuthError.h"
#include "../Clock.h"
#include "../repositories/IRateLimitRepository.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace AuthKeep {

/**
 * @brief Independent counter namespaces
 */
enum class RateLimitScope {
    InitiatePerIp,
    InitiatePerIdentifier,
    VerifyPerSession,
    VerifyPerIp
};

[[nodiscard]] constexpr std::string_view to_string(RateLimitScope scope) noexcept {
    switch (scope) {
        case RateLimitScope::InitiatePerIp:         return "otp-initiate-ip";
        case RateLimitScope::InitiatePerIdentifier: return "otp-initiate-identifier";
        case RateLimitScope::VerifyPerSession:      return "otp-verify-session";
        case RateLimitScope::VerifyPerIp:           return "otp-verify-ip";
    }
    return "unknown";
}

struct RateLimitPolicy {
    uint32_t limit;
    std::chrono::milliseconds window;
};

/**
 * @brief Limits for each scope (defaults match production settings)
 */
struct RateLimitPolicies {
    RateLimitPolicy initiate_per_ip{50, std::chrono::hours{1}};
    RateLimitPolicy initiate_per_identifier{10, std::chrono::hours{1}};
    RateLimitPolicy verify_per_session{5, std::chrono::minutes{1}};
    RateLimitPolicy verify_per_ip{20, std::chrono::minutes{1}};

    [[nodiscard]] const RateLimitPolicy& for_scope(RateLimitScope scope) const noexcept {
        switch (scope) {
            case RateLimitScope::InitiatePerIp:         return initiate_per_ip;
            case RateLimitScope::InitiatePerIdentifier: return initiate_per_identifier;
            case RateLimitScope::VerifyPerSession:      return verify_per_session;
            case RateLimitScope::VerifyPerIp:           return verify_per_ip;
        }
        return initiate_per_ip;
    }
};

/**
 * @brief Result of one counted request
 */
struct RateLimitDecision {
    bool allowed{false};
    uint32_t remaining{0};
    TimePoint reset_time{};
    std::chrono::seconds retry_after{0};  ///< Whole seconds until reset_time, 0 when allowed
};

class RateLimiter {
public:
    /**
     * @param repository Non-owning counter store
     * @param clock Non-owning time source
     * @throws std::invalid_argument if either pointer is null
     */
    RateLimiter(IRateLimitRepository* repository, const IClock* clock,
                RateLimitPolicies policies = {});

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;
    RateLimiter(RateLimiter&&) = delete;
    RateLimiter& operator=(RateLimiter&&) = delete;

    /**
     * @brief Count one request against key and decide
     *
     * The first request of a window sets the count to 1. Once the count
     * exceeds limit, requests are refused until windowStart + window.
     * Refused requests still count, so hammering does not reopen the window.
     *
     * @return Decision, or InternalError if the store fails
     */
    [[nodiscard]] AuthResult<RateLimitDecision> check_and_consume(
        std::string_view key,
        uint32_t limit,
        std::chrono::milliseconds window);

    /**
     * @brief Count one request for a subject under a scope's policy
     * @param subject Raw subject (IP, identifier hash, session id); hashed into the key
     */
    [[nodiscard]] AuthResult<RateLimitDecision> check(RateLimitScope scope, std::string_view subject);

    /** @brief "<scope>:<sha256 hex of subject>" */
    [[nodiscard]] static AuthResult<std::string> make_key(RateLimitScope scope, std::string_view subject);

    /**
     * @brief Purge counters whose window has elapsed
     * @return Number of counters removed
     */
    [[nodiscard]] AuthResult<size_t> cleanup_expired();

    [[nodiscard]] const RateLimitPolicies& policies() const noexcept { return m_policies; }

private:
    IRateLimitRepository* m_repository;
    const IClock* m_clock;
    RateLimitPolicies m_policies;
};

} // namespace AuthKeep
