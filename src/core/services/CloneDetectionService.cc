// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "CloneDetectionService.h"
#include "IdentifierHashService.h"
#include "../crypto/SecureRandom.h"
#include "../../utils/Log.h"

#include <stdexcept>

namespace AuthKeep {

namespace {

constexpr size_t RP_ID_HASH_LENGTH = 32;
constexpr size_t SIGN_COUNT_OFFSET = RP_ID_HASH_LENGTH + 1;  // after flags
constexpr size_t SIGN_COUNT_LENGTH = 4;

} // namespace

std::optional<uint32_t> parse_sign_count(std::span<const uint8_t> authenticator_data) noexcept {
    if (authenticator_data.size() < SIGN_COUNT_OFFSET + SIGN_COUNT_LENGTH) {
        return std::nullopt;
    }
    const auto* p = authenticator_data.data() + SIGN_COUNT_OFFSET;
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

CloneDetectionService::CloneDetectionService(IWebAuthnRepository* repository,
                                             const IAssertionVerifier* verifier,
                                             IAuditSink* audit,
                                             const IClock* clock,
                                             WebAuthnSettings settings)
    : m_repository(repository)
    , m_verifier(verifier)
    , m_audit(audit)
    , m_clock(clock)
    , m_settings(std::move(settings)) {
    if (!m_repository) {
        throw std::invalid_argument("CloneDetectionService: repository cannot be null");
    }
    if (!m_verifier) {
        throw std::invalid_argument("CloneDetectionService: assertion verifier cannot be null");
    }
    if (!m_audit) {
        throw std::invalid_argument("CloneDetectionService: audit sink cannot be null");
    }
    if (!m_clock) {
        throw std::invalid_argument("CloneDetectionService: clock cannot be null");
    }
}

AuthResult<AuthenticationOptions> CloneDetectionService::start_authentication(std::string_view identifier) {
    auto hashed_identifier = IdentifierHashService::hash_identifier(identifier);
    if (!hashed_identifier) {
        return std::unexpected(hashed_identifier.error());
    }

    const TimePoint now = m_clock->now();
    auto challenge_bytes = SecureRandom::generate_random_bytes(CHALLENGE_BYTES);

    authkeep::WebAuthnChallenge challenge;
    challenge.set_hashed_identifier(*hashed_identifier);
    challenge.set_challenge(std::string(challenge_bytes.begin(), challenge_bytes.end()));
    challenge.set_created_at(to_epoch_ms(now));
    challenge.set_expires_at(to_epoch_ms(now + m_settings.challenge_ttl));

    if (auto stored = m_repository->store_challenge(challenge); !stored) {
        Log::error("CloneDetectionService: failed to store challenge: {}", to_string(stored.error()));
        m_audit->append(make_audit_entry(AuditEvent::WebAuthnError, *hashed_identifier, now,
                                         {{"stage", "store_challenge"}}));
        return std::unexpected(AuthError::InternalError);
    }

    auto credentials = m_repository->list_active_credentials(*hashed_identifier);
    if (!credentials) {
        Log::error("CloneDetectionService: failed to list credentials: {}", to_string(credentials.error()));
        return std::unexpected(AuthError::InternalError);
    }

    AuthenticationOptions options;
    options.challenge = std::move(challenge_bytes);
    options.rp_id = m_settings.rp_id;
    options.timeout = m_settings.timeout;
    options.allow_credentials.reserve(credentials->size());
    for (const auto& credential : *credentials) {
        options.allow_credentials.push_back(credential.credential_id());
    }

    m_audit->append(make_audit_entry(AuditEvent::WebAuthnChallengeIssued, *hashed_identifier, now,
                                     {{"credentials", std::to_string(options.allow_credentials.size())}}));
    return options;
}

AuthResult<WebAuthnAuthentication> CloneDetectionService::complete_authentication(
    std::string_view identifier,
    const AssertionResponse& assertion) {

    auto hashed_identifier = IdentifierHashService::hash_identifier(identifier);
    if (!hashed_identifier) {
        return std::unexpected(hashed_identifier.error());
    }
    const std::string& subject = *hashed_identifier;

    const TimePoint now = m_clock->now();
    const int64_t now_ms = to_epoch_ms(now);

    // 1. Resolve the credential
    auto credential = m_repository->find_credential(assertion.credential_id);
    if (!credential && credential.error() != RepositoryError::NOT_FOUND) {
        Log::error("CloneDetectionService: credential lookup failed: {}", to_string(credential.error()));
        m_audit->append(make_audit_entry(AuditEvent::WebAuthnError, subject, now,
                                         {{"stage", "find_credential"}}));
        return std::unexpected(AuthError::InternalError);
    }
    if (!credential || !credential->is_active() || credential->hashed_identifier() != subject) {
        std::string_view reason = !credential ? "unknown"
            : !credential->is_active() ? "inactive" : "owner_mismatch";
        m_audit->append(make_audit_entry(AuditEvent::WebAuthnCredentialRejected, subject, now,
                                         {{"credential_id", assertion.credential_id}, {"reason", reason}}));
        return std::unexpected(AuthError::CredentialNotFoundOrInactive);
    }

    // 2. Consume the pending challenge, then verify the signature
    auto challenge = m_repository->take_challenge(subject);
    if (!challenge) {
        if (challenge.error() != RepositoryError::NOT_FOUND) {
            Log::error("CloneDetectionService: challenge lookup failed: {}", to_string(challenge.error()));
            m_audit->append(make_audit_entry(AuditEvent::WebAuthnError, subject, now,
                                             {{"stage", "take_challenge"}}));
            return std::unexpected(AuthError::InternalError);
        }
        m_audit->append(make_audit_entry(AuditEvent::WebAuthnAssertionInvalid, subject, now,
                                         {{"credential_id", assertion.credential_id},
                                          {"reason", "no_pending_challenge"}}));
        return std::unexpected(AuthError::AssertionInvalid);
    }
    if (now_ms > challenge->expires_at()) {
        m_audit->append(make_audit_entry(AuditEvent::WebAuthnAssertionInvalid, subject, now,
                                         {{"credential_id", assertion.credential_id},
                                          {"reason", "challenge_expired"}}));
        return std::unexpected(AuthError::AssertionInvalid);
    }

    AssertionExpectation expected;
    expected.challenge.assign(challenge->challenge().begin(), challenge->challenge().end());
    expected.rp_id = m_settings.rp_id;
    expected.origins = m_settings.origins;
    expected.public_key = credential->public_key();
    expected.challenge_expires_at = from_epoch_ms(challenge->expires_at());

    auto verified = m_verifier->verify(assertion, expected);
    if (!verified) {
        m_audit->append(make_audit_entry(AuditEvent::WebAuthnAssertionInvalid, subject, now,
                                         {{"credential_id", assertion.credential_id},
                                          {"reason", "verification_failed"}}));
        return std::unexpected(AuthError::AssertionInvalid);
    }

    // 3. Counter must strictly increase
    const uint64_t presented = verified->new_counter;
    if (presented <= credential->counter()) {
        return std::unexpected(reject_clone(*credential, presented, now_ms));
    }

    // 4. Conditional update; a concurrent assertion may have moved the counter
    auto update = m_repository->advance_counter(assertion.credential_id, presented, now_ms);
    if (!update) {
        Log::error("CloneDetectionService: counter update failed: {}", to_string(update.error()));
        m_audit->append(make_audit_entry(AuditEvent::WebAuthnError, subject, now,
                                         {{"stage", "advance_counter"}}));
        return std::unexpected(AuthError::InternalError);
    }
    if (!update->applied) {
        if (!update->record.is_active()) {
            m_audit->append(make_audit_entry(AuditEvent::WebAuthnCredentialRejected, subject, now,
                                             {{"credential_id", assertion.credential_id},
                                              {"reason", "inactive"}}));
            return std::unexpected(AuthError::CredentialNotFoundOrInactive);
        }
        return std::unexpected(reject_clone(update->record, presented, now_ms));
    }

    m_audit->append(make_audit_entry(AuditEvent::WebAuthnSuccess, subject, now,
                                     {{"credential_id", assertion.credential_id},
                                      {"counter", std::to_string(presented)}}));
    Log::info("WebAuthn authentication succeeded (subject {})", subject);
    return WebAuthnAuthentication{subject, assertion.credential_id, presented};
}

AuthError CloneDetectionService::reject_clone(const authkeep::WebAuthnCredential& credential,
                                              uint64_t presented_counter, int64_t now_ms) {
    const TimePoint now = from_epoch_ms(now_ms);
    m_audit->append(make_audit_entry(AuditEvent::CloningDetected, credential.hashed_identifier(), now,
                                     {{"credential_id", credential.credential_id()},
                                      {"stored_counter", std::to_string(credential.counter())},
                                      {"presented_counter", std::to_string(presented_counter)}}));
    Log::warning("WebAuthn counter regression on credential {} ({} <= {}), disabling",
                 credential.credential_id(), presented_counter, credential.counter());

    auto deactivated = m_repository->deactivate_credential(credential.credential_id(), now_ms);
    if (!deactivated) {
        Log::error("CloneDetectionService: failed to deactivate credential {}: {}",
                   credential.credential_id(), to_string(deactivated.error()));
        return AuthError::InternalError;
    }
    return AuthError::CloneDetected;
}

AuthResult<size_t> CloneDetectionService::cleanup_expired() {
    auto removed = m_repository->delete_expired_challenges(to_epoch_ms(m_clock->now()));
    if (!removed) {
        Log::error("CloneDetectionService: cleanup failed: {}", to_string(removed.error()));
        return std::unexpected(to_auth_error(removed.error()));
    }
    return *removed;
}

} // namespace AuthKeep
