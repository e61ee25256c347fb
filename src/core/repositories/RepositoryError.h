// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file RepositoryError.h
 * @brief Error type shared by all store repositories
 */

#pragma once

#include "../AuthError.h"
#include <expected>
#include <string_view>

namespace AuthKeep {

/**
 * @brief Error types for repository operations
 */
enum class RepositoryError {
    NOT_FOUND,              ///< No row matches the key
    DUPLICATE_ID,           ///< Row with this key already exists
    SAVE_FAILED,            ///< Failed to persist changes (mutation rolled back)
    STORE_UNAVAILABLE,      ///< Backing store cannot be reached
    UNKNOWN_ERROR           ///< Unspecified error
};

/**
 * @brief Convert error to human-readable string
 */
[[nodiscard]] constexpr std::string_view to_string(RepositoryError error) noexcept {
    switch (error) {
        case RepositoryError::NOT_FOUND:          return "Record not found";
        case RepositoryError::DUPLICATE_ID:       return "Duplicate record ID";
        case RepositoryError::SAVE_FAILED:        return "Failed to save";
        case RepositoryError::STORE_UNAVAILABLE:  return "Store unavailable";
        case RepositoryError::UNKNOWN_ERROR:      return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Map a repository failure to the service-level taxonomy
 *
 * NOT_FOUND maps to AuthError::NotFound; callers that need a different
 * meaning for a missing row (e.g. an unknown credential) translate it
 * themselves before calling this.
 */
[[nodiscard]] constexpr AuthError to_auth_error(RepositoryError error) noexcept {
    switch (error) {
        case RepositoryError::NOT_FOUND:
            return AuthError::NotFound;
        case RepositoryError::DUPLICATE_ID:
        case RepositoryError::SAVE_FAILED:
        case RepositoryError::STORE_UNAVAILABLE:
        case RepositoryError::UNKNOWN_ERROR:
            return AuthError::InternalError;
    }
    return AuthError::InternalError;
}

template<typename T = void>
using RepositoryResult = std::expected<T, RepositoryError>;

} // namespace AuthKeep
