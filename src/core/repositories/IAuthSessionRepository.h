// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IAuthSessionRepository.h
 * @brief Interface for issued bearer sessions
 */

#pragma once

#include "RepositoryError.h"
#include "auth_records.pb.h"
#include <cstdint>
#include <string_view>

namespace AuthKeep {

/**
 * @brief Interface for authenticated session storage
 *
 * Sessions are keyed by the SHA-256 of the bearer token; the token itself
 * is never handed to the store.
 */
class IAuthSessionRepository {
public:
    virtual ~IAuthSessionRepository() = default;

    [[nodiscard]] virtual RepositoryResult<> insert_auth_session(
        const authkeep::AuthSession& session) = 0;

    [[nodiscard]] virtual RepositoryResult<authkeep::AuthSession> find_auth_session(
        std::string_view token_hash) const = 0;

    [[nodiscard]] virtual RepositoryResult<size_t> delete_expired_auth_sessions(int64_t now_ms) = 0;
};

} // namespace AuthKeep
