// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "AuthService.h"
#include "IdentifierHashService.h"
#include "../crypto/SecureRandom.h"
#include "../../utils/Log.h"

#include <stdexcept>

namespace AuthKeep {

AuthService::AuthService(OtpSessionService* otp,
                         RateLimiter* rate_limiter,
                         CloneDetectionService* webauthn,
                         IAuthSessionRepository* sessions,
                         ICodeDelivery* delivery,
                         IAuditSink* audit,
                         const IClock* clock,
                         AuthServiceSettings settings)
    : m_otp(otp)
    , m_rate_limiter(rate_limiter)
    , m_webauthn(webauthn)
    , m_sessions(sessions)
    , m_delivery(delivery)
    , m_audit(audit)
    , m_clock(clock)
    , m_settings(settings) {
    if (!m_otp || !m_rate_limiter || !m_webauthn || !m_sessions ||
        !m_delivery || !m_audit || !m_clock) {
        throw std::invalid_argument("AuthService: collaborators cannot be null");
    }
}

template<typename F>
auto AuthService::guarded(std::string_view operation, F&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const std::exception& e) {
        Log::error("AuthService: {} failed: {}", operation, e.what());
        return std::unexpected(make_failure(AuthError::InternalError));
    }
}

ApiResult<void> AuthService::enforce_limit(RateLimitScope scope, std::string_view subject,
                                           std::string_view audit_subject) {
    auto decision = m_rate_limiter->check(scope, subject);
    if (!decision) {
        return std::unexpected(make_failure(decision.error()));
    }
    if (!decision->allowed) {
        m_audit->append(make_audit_entry(AuditEvent::RateLimitExceeded, audit_subject, m_clock->now(),
                                         {{"scope", to_string(scope)},
                                          {"retry_after", std::to_string(decision->retry_after.count())}}));
        AuthFailure failure = make_failure(AuthError::RateLimited);
        failure.retry_after = decision->retry_after;
        return std::unexpected(failure);
    }
    return {};
}

AuthResult<std::string> AuthService::issue_session_token(std::string_view hashed_identifier,
                                                         std::string_view method) {
    std::string token = SecureRandom::random_hex(SESSION_TOKEN_BYTES);
    auto token_hash = IdentifierHashService::sha256_hex(token);
    if (!token_hash) {
        return std::unexpected(token_hash.error());
    }

    const TimePoint now = m_clock->now();
    authkeep::AuthSession session;
    session.set_token_hash(*token_hash);
    session.set_hashed_identifier(std::string(hashed_identifier));
    session.set_method(std::string(method));
    session.set_created_at(to_epoch_ms(now));
    session.set_expires_at(to_epoch_ms(now + m_settings.session_ttl));

    if (auto inserted = m_sessions->insert_auth_session(session); !inserted) {
        Log::error("AuthService: failed to store auth session: {}", to_string(inserted.error()));
        return std::unexpected(AuthError::InternalError);
    }

    m_audit->append(make_audit_entry(AuditEvent::SessionIssued, hashed_identifier, now,
                                     {{"method", method}}));
    return token;
}

// ============================================================================
// OTP
// ============================================================================

ApiResult<InitiateResponse> AuthService::initiate(std::string_view identifier, const ClientMeta& meta) {
    return guarded("initiate", [&]() -> ApiResult<InitiateResponse> {
        auto hashed_identifier = IdentifierHashService::hash_identifier(identifier);
        if (!hashed_identifier) {
            return std::unexpected(make_failure(hashed_identifier.error()));
        }

        if (auto allowed = enforce_limit(RateLimitScope::InitiatePerIp, meta.ip_address,
                                         *hashed_identifier); !allowed) {
            return std::unexpected(allowed.error());
        }
        if (auto allowed = enforce_limit(RateLimitScope::InitiatePerIdentifier, *hashed_identifier,
                                         *hashed_identifier); !allowed) {
            return std::unexpected(allowed.error());
        }

        auto issue = m_otp->create_session(identifier, m_settings.otp_ttl, meta);
        if (!issue) {
            return std::unexpected(make_failure(issue.error()));
        }

        InitiateResponse response;
        response.session_id = issue->session_id;
        response.expires_in_seconds =
            std::chrono::duration_cast<std::chrono::seconds>(m_settings.otp_ttl).count();

        const CodeMessage message{identifier, issue->hashed_identifier, issue->code.view(),
                                  issue->expires_at, m_settings.otp_ttl};
        auto delivered = m_delivery->deliver(message);
        response.delivered = delivered.has_value();
        if (!delivered) {
            Log::warning("AuthService: code delivery failed for subject {}", issue->hashed_identifier);
            m_audit->append(make_audit_entry(AuditEvent::OtpDeliveryFailed, issue->hashed_identifier,
                                             m_clock->now(), {{"session_id", issue->session_id}}));
        }

        if (!m_settings.production) {
            response.code = std::string(issue->code.view());
        }
        return response;
    });
}

ApiResult<VerifyResponse> AuthService::verify(std::string_view session_id, std::string_view code,
                                              const ClientMeta& meta) {
    return guarded("verify", [&]() -> ApiResult<VerifyResponse> {
        if (auto allowed = enforce_limit(RateLimitScope::VerifyPerSession, session_id, ""); !allowed) {
            return std::unexpected(allowed.error());
        }
        if (auto allowed = enforce_limit(RateLimitScope::VerifyPerIp, meta.ip_address, ""); !allowed) {
            return std::unexpected(allowed.error());
        }

        auto result = m_otp->verify_session(session_id, code);
        if (!result) {
            AuthFailure failure = make_failure(result.error());
            if (result.error() == AuthError::AttemptsExceeded) {
                failure.attempts_remaining = 0;
            }
            return std::unexpected(failure);
        }

        VerifyResponse response;
        response.success = result->success;
        response.attempts_remaining = result->attempts_remaining;
        if (!result->success) {
            return response;
        }

        auto token = issue_session_token(result->hashed_identifier, "otp");
        if (!token) {
            return std::unexpected(make_failure(token.error()));
        }
        response.session_token = std::move(*token);
        return response;
    });
}

// ============================================================================
// WebAuthn
// ============================================================================

ApiResult<AuthenticationOptions> AuthService::webauthn_start(std::string_view identifier) {
    return guarded("webauthn_start", [&]() -> ApiResult<AuthenticationOptions> {
        auto options = m_webauthn->start_authentication(identifier);
        if (!options) {
            return std::unexpected(make_failure(options.error()));
        }
        return std::move(*options);
    });
}

ApiResult<WebAuthnCompleteResponse> AuthService::webauthn_complete(
    std::string_view identifier,
    const AssertionResponse& assertion) {

    return guarded("webauthn_complete", [&]() -> ApiResult<WebAuthnCompleteResponse> {
        auto authenticated = m_webauthn->complete_authentication(identifier, assertion);
        if (!authenticated) {
            return std::unexpected(make_failure(authenticated.error()));
        }

        auto token = issue_session_token(authenticated->hashed_identifier, "webauthn");
        if (!token) {
            return std::unexpected(make_failure(token.error()));
        }
        return WebAuthnCompleteResponse{true, std::move(*token)};
    });
}

// ============================================================================
// Maintenance
// ============================================================================

ApiResult<SweepReport> AuthService::sweep_expired() {
    return guarded("sweep_expired", [&]() -> ApiResult<SweepReport> {
        SweepReport report;

        auto sessions = m_otp->cleanup_expired();
        if (!sessions) {
            return std::unexpected(make_failure(sessions.error()));
        }
        report.otp_sessions = *sessions;

        auto counters = m_rate_limiter->cleanup_expired();
        if (!counters) {
            return std::unexpected(make_failure(counters.error()));
        }
        report.rate_limit_counters = *counters;

        auto challenges = m_webauthn->cleanup_expired();
        if (!challenges) {
            return std::unexpected(make_failure(challenges.error()));
        }
        report.webauthn_challenges = *challenges;

        auto auth_sessions = m_sessions->delete_expired_auth_sessions(to_epoch_ms(m_clock->now()));
        if (!auth_sessions) {
            Log::error("AuthService: auth session cleanup failed: {}", to_string(auth_sessions.error()));
            return std::unexpected(make_failure(to_auth_error(auth_sessions.error())));
        }
        report.auth_sessions = *auth_sessions;

        Log::info("Sweep removed {} OTP sessions, {} counters, {} challenges, {} auth sessions",
                  report.otp_sessions, report.rate_limit_counters,
                  report.webauthn_challenges, report.auth_sessions);
        return report;
    });
}

ApiResult<SessionInfo> AuthService::validate_session_token(std::string_view token) {
    return guarded("validate_session_token", [&]() -> ApiResult<SessionInfo> {
        auto token_hash = IdentifierHashService::sha256_hex(token);
        if (!token_hash) {
            return std::unexpected(make_failure(token_hash.error()));
        }

        auto session = m_sessions->find_auth_session(*token_hash);
        if (!session) {
            return std::unexpected(make_failure(to_auth_error(session.error())));
        }
        if (to_epoch_ms(m_clock->now()) > session->expires_at()) {
            return std::unexpected(make_failure(AuthError::Expired));
        }
        return SessionInfo{session->hashed_identifier(), session->method(),
                           from_epoch_ms(session->expires_at())};
    });
}

} // namespace AuthKeep
