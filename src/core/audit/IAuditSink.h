// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IAuditSink.h
 * @brief Append-only audit trail
 *
 * The authentication core writes one entry per security-relevant outcome
 * and never reads entries back for control flow. Entries carry hashes and
 * opaque ids only; plaintext codes, passphrases and raw identifiers must
 * never appear in any field.
 */

#pragma once

#include "../Clock.h"
#include "auth_records.pb.h"
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace AuthKeep {

/**
 * @brief Audit event type names
 */
namespace AuditEvent {
    inline constexpr std::string_view OtpSessionCreated      = "otp_session_created";
    inline constexpr std::string_view OtpDeliveryFailed      = "otp_delivery_failed";
    inline constexpr std::string_view OtpVerifySuccess       = "otp_verify_success";
    inline constexpr std::string_view OtpVerifyInvalidCode   = "otp_verify_invalid_code";
    inline constexpr std::string_view OtpVerifyMalformed     = "otp_verify_malformed";
    inline constexpr std::string_view OtpVerifyNotFound      = "otp_verify_not_found";
    inline constexpr std::string_view OtpVerifyAlreadyUsed   = "otp_verify_already_used";
    inline constexpr std::string_view OtpVerifyExpired       = "otp_verify_expired";
    inline constexpr std::string_view OtpVerifyAttemptsExceeded = "otp_verify_attempts_exceeded";
    inline constexpr std::string_view OtpVerifyError         = "otp_verify_error";
    inline constexpr std::string_view OtpSessionsPurged      = "otp_sessions_purged";
    inline constexpr std::string_view RateLimitExceeded      = "rate_limit_exceeded";
    inline constexpr std::string_view WebAuthnChallengeIssued = "webauthn_challenge_issued";
    inline constexpr std::string_view WebAuthnSuccess        = "webauthn_success";
    inline constexpr std::string_view WebAuthnCredentialRejected = "webauthn_credential_rejected";
    inline constexpr std::string_view WebAuthnAssertionInvalid = "webauthn_assertion_invalid";
    inline constexpr std::string_view CloningDetected        = "webauthn_cloning_detected";
    inline constexpr std::string_view WebAuthnError          = "webauthn_error";
    inline constexpr std::string_view SessionIssued          = "auth_session_issued";
}

/**
 * @brief Append-only audit sink
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;

    /**
     * @brief Append one entry
     *
     * Must not throw; a sink that cannot record an entry logs the failure.
     */
    virtual void append(const authkeep::AuditLogEntry& entry) noexcept = 0;
};

/**
 * @brief Build an audit entry
 */
[[nodiscard]] inline authkeep::AuditLogEntry make_audit_entry(
    std::string_view event_type,
    std::string_view subject_hash,
    TimePoint when,
    std::initializer_list<std::pair<std::string_view, std::string_view>> details = {}) {

    authkeep::AuditLogEntry entry;
    entry.set_event_type(std::string(event_type));
    entry.set_subject_hash(std::string(subject_hash));
    entry.set_timestamp(to_epoch_ms(when));
    for (const auto& [key, value] : details) {
        (*entry.mutable_details())[std::string(key)] = std::string(value);
    }
    return entry;
}

/**
 * @brief Writes each entry through AuthKeep::Log at Info level
 */
class LogAuditSink final : public IAuditSink {
public:
    void append(const authkeep::AuditLogEntry& entry) noexcept override;
};

/**
 * @brief Forwards each entry to several sinks (non-owning)
 */
class FanoutAuditSink final : public IAuditSink {
public:
    explicit FanoutAuditSink(std::vector<IAuditSink*> sinks);

    void append(const authkeep::AuditLogEntry& entry) noexcept override;

private:
    std::vector<IAuditSink*> m_sinks;
};

} // namespace AuthKeep
