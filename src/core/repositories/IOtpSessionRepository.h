// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IOtpSessionRepository.h
 * @brief Interface for OTP session persistence
 */

#pragma once

#include "RepositoryError.h"
#include "auth_records.pb.h"
#include <cstdint>
#include <string_view>

namespace AuthKeep {

/**
 * @brief Outcome of an attempt claim
 *
 * When claimed is false, record holds the state that failed the condition,
 * read under the same lock as the check, so the caller can report the
 * precise reason without a second read.
 */
struct OtpAttemptClaim {
    bool claimed{false};
    authkeep::OtpSessionRecord record;
};

/**
 * @brief Interface for OTP session storage
 *
 * Every state transition is a single conditional update so that
 * concurrent verifications of one session cannot both succeed.
 *
 * @note Implementations must be thread-safe
 */
class IOtpSessionRepository {
public:
    virtual ~IOtpSessionRepository() = default;

    /**
     * @brief Store a new session
     *
     * Errors:
     * - DUPLICATE_ID: session id already exists
     * - SAVE_FAILED: persistence failed
     */
    [[nodiscard]] virtual RepositoryResult<> insert_session(
        const authkeep::OtpSessionRecord& session) = 0;

    /**
     * @brief Read a session by id
     *
     * Errors:
     * - NOT_FOUND: no such session
     */
    [[nodiscard]] virtual RepositoryResult<authkeep::OtpSessionRecord> find_session(
        std::string_view session_id) const = 0;

    /**
     * @brief Consume one verification attempt
     *
     * Equivalent to:
     *   UPDATE otp_sessions SET attempts = attempts + 1
     *   WHERE session_id = ? AND used = false AND attempts < max_attempts
     *     AND expires_at >= now
     *
     * Errors:
     * - NOT_FOUND: no such session
     */
    [[nodiscard]] virtual RepositoryResult<OtpAttemptClaim> claim_attempt(
        std::string_view session_id,
        uint32_t max_attempts,
        int64_t now_ms) = 0;

    /**
     * @brief Mark a session used
     *
     * Equivalent to:
     *   UPDATE otp_sessions SET used = true, used_at = now
     *   WHERE session_id = ? AND used = false
     *
     * @return true if this call flipped the flag, false if already used
     */
    [[nodiscard]] virtual RepositoryResult<bool> mark_used(
        std::string_view session_id,
        int64_t now_ms) = 0;

    /**
     * @brief Delete sessions whose expires_at is before now
     * @return Number of rows removed (0 when another worker got there first)
     */
    [[nodiscard]] virtual RepositoryResult<size_t> delete_expired_sessions(int64_t now_ms) = 0;
};

} // namespace AuthKeep
