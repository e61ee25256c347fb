// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "OtpSessionService.h"
#include "IdentifierHashService.h"
#include "../crypto/SecureRandom.h"
#include "../../utils/Log.h"
#include "../../utils/StringHelpers.h"

#include <stdexcept>

namespace AuthKeep {

OtpSessionService::OtpSessionService(IOtpSessionRepository* repository, IAuditSink* audit,
                                     const IClock* clock)
    : m_repository(repository)
    , m_audit(audit)
    , m_clock(clock) {
    if (!m_repository) {
        throw std::invalid_argument("OtpSessionService: repository cannot be null");
    }
    if (!m_audit) {
        throw std::invalid_argument("OtpSessionService: audit sink cannot be null");
    }
    if (!m_clock) {
        throw std::invalid_argument("OtpSessionService: clock cannot be null");
    }
}

void OtpSessionService::audit(std::string_view event, std::string_view subject_hash,
                              std::string_view session_id,
                              std::initializer_list<std::pair<std::string_view, std::string_view>> extra) {
    auto entry = make_audit_entry(event, subject_hash, m_clock->now(), extra);
    (*entry.mutable_details())["session_id"] = std::string(session_id);
    m_audit->append(entry);
}

AuthResult<OtpIssue> OtpSessionService::create_session(
    std::string_view identifier,
    std::chrono::minutes ttl,
    const ClientMeta& meta) {

    if (ttl <= std::chrono::minutes::zero()) {
        Log::warning("OtpSessionService: rejecting non-positive ttl {}", ttl.count());
        return std::unexpected(AuthError::ValidationError);
    }

    auto hashed_identifier = IdentifierHashService::hash_identifier(identifier);
    if (!hashed_identifier) {
        return std::unexpected(hashed_identifier.error());
    }

    SecureString code{SecureRandom::otp_code()};
    const std::string salt = SecureRandom::random_hex(SALT_BYTES);
    auto otp_hash = IdentifierHashService::hash_code(code.view(), salt);
    if (!otp_hash) {
        return std::unexpected(otp_hash.error());
    }

    const TimePoint now = m_clock->now();
    const TimePoint expires_at = now + ttl;

    authkeep::OtpSessionRecord record;
    record.set_session_id(SecureRandom::random_hex(SESSION_ID_BYTES));
    record.set_hashed_identifier(*hashed_identifier);
    record.set_otp_hash(*otp_hash);
    record.set_salt(salt);
    record.set_created_at(to_epoch_ms(now));
    record.set_expires_at(to_epoch_ms(expires_at));
    record.set_attempts(0);
    record.set_used(false);
    auto* client_meta = record.mutable_client_meta();
    client_meta->set_user_agent(meta.user_agent);
    client_meta->set_ip_address(meta.ip_address);
    client_meta->set_domain_hint(meta.domain_hint);

    if (auto inserted = m_repository->insert_session(record); !inserted) {
        Log::error("OtpSessionService: failed to store session: {}", to_string(inserted.error()));
        return std::unexpected(AuthError::InternalError);
    }

    audit(AuditEvent::OtpSessionCreated, *hashed_identifier, record.session_id(),
          {{"ttl_minutes", std::to_string(ttl.count())}});
    Log::info("OTP session created (subject {})", *hashed_identifier);

    return OtpIssue{record.session_id(), *hashed_identifier, std::move(code), expires_at};
}

AuthResult<OtpVerification> OtpSessionService::verify_session(
    std::string_view session_id,
    std::string_view code) {

    if (!is_otp_code_format(code)) {
        audit(AuditEvent::OtpVerifyMalformed, "", session_id);
        return std::unexpected(AuthError::ValidationError);
    }

    const TimePoint now = m_clock->now();
    const int64_t now_ms = to_epoch_ms(now);

    auto claim = m_repository->claim_attempt(session_id, MAX_ATTEMPTS, now_ms);
    if (!claim) {
        if (claim.error() == RepositoryError::NOT_FOUND) {
            audit(AuditEvent::OtpVerifyNotFound, "", session_id);
            return std::unexpected(AuthError::NotFound);
        }
        Log::error("OtpSessionService: attempt claim failed: {}", to_string(claim.error()));
        audit(AuditEvent::OtpVerifyError, "", session_id);
        return std::unexpected(AuthError::InternalError);
    }

    const auto& session = claim->record;
    const std::string& subject = session.hashed_identifier();

    if (!claim->claimed) {
        if (session.used()) {
            audit(AuditEvent::OtpVerifyAlreadyUsed, subject, session_id);
            return std::unexpected(AuthError::AlreadyUsed);
        }
        if (now_ms > session.expires_at()) {
            audit(AuditEvent::OtpVerifyExpired, subject, session_id);
            return std::unexpected(AuthError::Expired);
        }
        audit(AuditEvent::OtpVerifyAttemptsExceeded, subject, session_id,
              {{"attempts", std::to_string(session.attempts())}});
        return std::unexpected(AuthError::AttemptsExceeded);
    }

    if (!IdentifierHashService::verify_code(code, session.salt(), session.otp_hash())) {
        const uint32_t remaining = session.attempts() >= MAX_ATTEMPTS
            ? 0 : MAX_ATTEMPTS - session.attempts();
        audit(AuditEvent::OtpVerifyInvalidCode, subject, session_id,
              {{"attempts_remaining", std::to_string(remaining)}});
        return OtpVerification{false, subject, remaining};
    }

    auto marked = m_repository->mark_used(session_id, now_ms);
    if (!marked) {
        Log::error("OtpSessionService: failed to mark session used: {}", to_string(marked.error()));
        audit(AuditEvent::OtpVerifyError, subject, session_id);
        return std::unexpected(AuthError::InternalError);
    }
    if (!*marked) {
        // A concurrent verify with the same code won the race
        audit(AuditEvent::OtpVerifyAlreadyUsed, subject, session_id);
        return std::unexpected(AuthError::AlreadyUsed);
    }

    audit(AuditEvent::OtpVerifySuccess, subject, session_id);
    Log::info("OTP verified (subject {})", subject);
    return OtpVerification{true, subject, MAX_ATTEMPTS - session.attempts()};
}

AuthResult<size_t> OtpSessionService::cleanup_expired() {
    const TimePoint now = m_clock->now();
    auto removed = m_repository->delete_expired_sessions(to_epoch_ms(now));
    if (!removed) {
        Log::error("OtpSessionService: cleanup failed: {}", to_string(removed.error()));
        return std::unexpected(to_auth_error(removed.error()));
    }
    if (*removed > 0) {
        m_audit->append(make_audit_entry(AuditEvent::OtpSessionsPurged, "", now,
                                         {{"count", std::to_string(*removed)}}));
        Log::info("OtpSessionService: purged {} expired sessions", *removed);
    }
    return *removed;
}

} // namespace AuthKeep
