// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file AuthService.h
 * @brief Inbound authentication operations
 *
 * Composes rate limiting, OTP sessions, code delivery, WebAuthn clone
 * detection and bearer-session issuance into the operations exposed to
 * the transport layer. Results use ApiResult so that rate-limit timing
 * and remaining attempts reach the caller, while every other failure
 * carries only its stable message.
 *
 * No exception escapes this class: anything thrown below (CSPRNG failure,
 * allocation failure) is logged and reported as InternalError.
 */

#pragma once

#include "CloneDetectionService.h"
#include "OtpSessionService.h"
#include "RateLimiter.h"
#include "../AuthError.h"
#include "../Clock.h"
#include "../audit/IAuditSink.h"
#include "../delivery/ICodeDelivery.h"
#include "../repositories/IAuthSessionRepository.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace AuthKeep {

struct AuthServiceSettings {
    bool production{true};                       ///< Never expose codes when set
    std::chrono::minutes otp_ttl{OtpSessionService::DEFAULT_TTL};
    std::chrono::minutes session_ttl{60};
};

struct InitiateResponse {
    std::string session_id;
    int64_t expires_in_seconds{0};
    bool delivered{false};
    std::optional<std::string> code;             ///< Only outside production
};

struct VerifyResponse {
    bool success{false};
    uint32_t attempts_remaining{0};
    std::optional<std::string> session_token;    ///< Set on success
};

struct WebAuthnCompleteResponse {
    bool success{false};
    std::string session_token;
};

/**
 * @brief Rows purged by one sweep
 */
struct SweepReport {
    size_t otp_sessions{0};
    size_t rate_limit_counters{0};
    size_t webauthn_challenges{0};
    size_t auth_sessions{0};
};

/**
 * @brief Owner of a live bearer session
 */
struct SessionInfo {
    std::string hashed_identifier;
    std::string method;
    TimePoint expires_at;
};

class AuthService {
public:
    static constexpr size_t SESSION_TOKEN_BYTES = 32;

    /**
     * All collaborators are non-owning and must outlive the service.
     * @throws std::invalid_argument if any pointer is null
     */
    AuthService(OtpSessionService* otp,
                RateLimiter* rate_limiter,
                CloneDetectionService* webauthn,
                IAuthSessionRepository* sessions,
                ICodeDelivery* delivery,
                IAuditSink* audit,
                const IClock* clock,
                AuthServiceSettings settings = {});

    AuthService(const AuthService&) = delete;
    AuthService& operator=(const AuthService&) = delete;
    AuthService(AuthService&&) = delete;
    AuthService& operator=(AuthService&&) = delete;

    /**
     * @brief Start OTP sign-in
     *
     * Rate limited per client IP and per identifier. A delivery failure is
     * logged and audited but the session is still returned.
     */
    [[nodiscard]] ApiResult<InitiateResponse> initiate(
        std::string_view identifier,
        const ClientMeta& meta);

    /**
     * @brief Complete OTP sign-in
     *
     * Rate limited per session and per client IP. A wrong code returns
     * success=false with the remaining attempts; a correct code returns a
     * bearer token.
     */
    [[nodiscard]] ApiResult<VerifyResponse> verify(
        std::string_view session_id,
        std::string_view code,
        const ClientMeta& meta);

    [[nodiscard]] ApiResult<AuthenticationOptions> webauthn_start(std::string_view identifier);

    [[nodiscard]] ApiResult<WebAuthnCompleteResponse> webauthn_complete(
        std::string_view identifier,
        const AssertionResponse& assertion);

    /**
     * @brief Run every expiry cleanup
     *
     * Not meant for the request path; call from a timer or `authkeep sweep`.
     */
    [[nodiscard]] ApiResult<SweepReport> sweep_expired();

    /**
     * @brief Resolve a bearer token to its session
     * @return NotFound for unknown tokens, Expired past expires_at
     */
    [[nodiscard]] ApiResult<SessionInfo> validate_session_token(std::string_view token);

private:
    [[nodiscard]] ApiResult<void> enforce_limit(RateLimitScope scope, std::string_view subject,
                                                std::string_view audit_subject);
    [[nodiscard]] AuthResult<std::string> issue_session_token(std::string_view hashed_identifier,
                                                              std::string_view method);

    template<typename F>
    [[nodiscard]] auto guarded(std::string_view operation, F&& body) -> decltype(body());

    OtpSessionService* m_otp;
    RateLimiter* m_rate_limiter;
    CloneDetectionService* m_webauthn;
    IAuthSessionRepository* m_sessions;
    ICodeDelivery* m_delivery;
    IAuditSink* m_audit;
    const IClock* m_clock;
    AuthServiceSettings m_settings;
};

} // namespace AuthKeep
