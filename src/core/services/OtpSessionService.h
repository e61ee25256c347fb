// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file OtpSessionService.h
 * @brief Issue, verify and expire one-time-code sessions
 *
 * Neither the delivery identifier nor the code is stored: the session
 * keeps SHA-256(identifier) and a salted hash of the code. The code is
 * handed back exactly once, for delivery.
 *
 * Session state machine:
 * @code
 *   Created --verify(ok)------------------> VerifiedSuccess   (terminal)
 *   Created --verify(wrong), attempts<3---> Created
 *   Created --now > expires_at------------> Expired           (terminal)
 *   Created --attempts == 3---------------> AttemptsExhausted (terminal)
 * @endcode
 *
 * Every verify outcome writes exactly one audit entry.
 */

#pragma once

#include "../AuthError.h"
#include "../Clock.h"
#include "../audit/IAuditSink.h"
#include "../repositories/IOtpSessionRepository.h"
#include "../../utils/SecureMemory.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace AuthKeep {

/**
 * @brief Request metadata stored with a session
 */
struct ClientMeta {
    std::string user_agent;
    std::string ip_address;
    std::string domain_hint;
};

/**
 * @brief A freshly issued session
 *
 * code is the plaintext one-time code. It exists only here and must go
 * to the delivery channel and nowhere else.
 */
struct OtpIssue {
    std::string session_id;
    std::string hashed_identifier;
    SecureString code;
    TimePoint expires_at;
};

/**
 * @brief Outcome of a verification that consumed an attempt
 *
 * A wrong code is not an error: success is false and attempts_remaining
 * tells the caller how many tries are left.
 */
struct OtpVerification {
    bool success{false};
    std::string hashed_identifier;
    uint32_t attempts_remaining{0};
};

class OtpSessionService {
public:
    static constexpr uint32_t MAX_ATTEMPTS = 3;
    static constexpr std::chrono::minutes DEFAULT_TTL{5};
    static constexpr size_t SESSION_ID_BYTES = 32;
    static constexpr size_t SALT_BYTES = 32;

    /**
     * @param repository Non-owning session store
     * @param audit Non-owning audit sink
     * @param clock Non-owning time source
     * @throws std::invalid_argument if any pointer is null
     */
    OtpSessionService(IOtpSessionRepository* repository, IAuditSink* audit, const IClock* clock);

    OtpSessionService(const OtpSessionService&) = delete;
    OtpSessionService& operator=(const OtpSessionService&) = delete;
    OtpSessionService(OtpSessionService&&) = delete;
    OtpSessionService& operator=(OtpSessionService&&) = delete;

    /**
     * @brief Create a session for an identifier
     *
     * @return Issued session, ValidationError for an unusable identifier or
     *         non-positive ttl, InternalError if the store fails
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] AuthResult<OtpIssue> create_session(
        std::string_view identifier,
        std::chrono::minutes ttl = DEFAULT_TTL,
        const ClientMeta& meta = {});

    /**
     * @brief Verify a supplied code
     *
     * Checks in order:
     * -# ValidationError if the code is not six ASCII digits (no attempt used)
     * -# NotFound if the session does not exist
     * -# AlreadyUsed if the session already succeeded
     * -# Expired if now > expires_at
     * -# AttemptsExceeded if attempts >= MAX_ATTEMPTS
     *
     * Otherwise one attempt is consumed atomically and the code compared in
     * constant time. A match marks the session used; if a concurrent call
     * marked it first, this call reports AlreadyUsed.
     */
    [[nodiscard]] AuthResult<OtpVerification> verify_session(
        std::string_view session_id,
        std::string_view code);

    /**
     * @brief Purge sessions past their expiry
     *
     * Idempotent; safe to run concurrently from several workers.
     */
    [[nodiscard]] AuthResult<size_t> cleanup_expired();

private:
    void audit(std::string_view event, std::string_view subject_hash, std::string_view session_id,
               std::initializer_list<std::pair<std::string_view, std::string_view>> extra = {});

    IOtpSessionRepository* m_repository;
    IAuditSink* m_audit;
    const IClock* m_clock;
};

} // namespace AuthKeep
