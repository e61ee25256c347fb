// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IWebAuthnRepository.h
 * @brief Interface for WebAuthn credentials and pending challenges
 */

#pragma once

#include "RepositoryError.h"
#include "auth_records.pb.h"
#include <cstdint>
#include <string_view>
#include <vector>

namespace AuthKeep {

/**
 * @brief Outcome of a conditional counter update
 *
 * When applied is false, record holds the state that failed the condition.
 */
struct CounterUpdate {
    bool applied{false};
    authkeep::WebAuthnCredential record;
};

/**
 * @brief Interface for WebAuthn storage
 *
 * @note Implementations must be thread-safe
 */
class IWebAuthnRepository {
public:
    virtual ~IWebAuthnRepository() = default;

    // ------------------------------------------------------------------
    // Credentials
    // ------------------------------------------------------------------

    /**
     * @brief Store a registered credential
     *
     * Errors:
     * - DUPLICATE_ID: credential id already exists
     */
    [[nodiscard]] virtual RepositoryResult<> insert_credential(
        const authkeep::WebAuthnCredential& credential) = 0;

    [[nodiscard]] virtual RepositoryResult<authkeep::WebAuthnCredential> find_credential(
        std::string_view credential_id) const = 0;

    [[nodiscard]] virtual RepositoryResult<std::vector<authkeep::WebAuthnCredential>>
    list_active_credentials(std::string_view hashed_identifier) const = 0;

    /**
     * @brief Advance the signature counter
     *
     * Equivalent to:
     *   UPDATE credentials SET counter = new_counter, last_used_at = now
     *   WHERE credential_id = ? AND is_active AND counter < new_counter
     *
     * Errors:
     * - NOT_FOUND: no such credential
     */
    [[nodiscard]] virtual RepositoryResult<CounterUpdate> advance_counter(
        std::string_view credential_id,
        uint64_t new_counter,
        int64_t now_ms) = 0;

    /**
     * @brief Permanently disable a credential
     * @return true if this call deactivated it, false if already inactive
     */
    [[nodiscard]] virtual RepositoryResult<bool> deactivate_credential(
        std::string_view credential_id,
        int64_t now_ms) = 0;

    // ------------------------------------------------------------------
    // Challenges
    // ------------------------------------------------------------------

    /**
     * @brief Store the pending challenge for a user, replacing any previous one
     */
    [[nodiscard]] virtual RepositoryResult<> store_challenge(
        const authkeep::WebAuthnChallenge& challenge) = 0;

    /**
     * @brief Remove and return the pending challenge for a user
     *
     * A challenge can be taken at most once.
     *
     * Errors:
     * - NOT_FOUND: no pending challenge
     */
    [[nodiscard]] virtual RepositoryResult<authkeep::WebAuthnChallenge> take_challenge(
        std::string_view hashed_identifier) = 0;

    [[nodiscard]] virtual RepositoryResult<size_t> delete_expired_challenges(int64_t now_ms) = 0;
};

} // namespace AuthKeep
