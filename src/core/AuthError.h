// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng
//
// AuthError.h - Error taxonomy for the authentication core
// C++23 std::expected-based error handling

#ifndef AUTHKEEP_AUTH_ERROR_H
#define AUTHKEEP_AUTH_ERROR_H

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>

namespace AuthKeep {

// Error kinds surfaced by the authentication core.
// Cryptographic verification failures deliberately share one kind per
// component so callers cannot distinguish which check rejected them.
enum class AuthError {
    // Request validation
    ValidationError,

    // OTP session lifecycle
    NotFound,
    Expired,
    AlreadyUsed,
    AttemptsExceeded,

    // Abuse control
    RateLimited,

    // Cryptography
    DecryptionFailed,

    // WebAuthn second factor
    CredentialNotFoundOrInactive,
    AssertionInvalid,
    CloneDetected,

    // Startup / environment
    ConfigurationError,

    // Generic
    InternalError
};

// Stable user-facing message for each error kind.
// These strings are part of the external contract; never put request data in them.
inline constexpr std::string_view to_string(AuthError error) noexcept {
    switch (error) {
        case AuthError::ValidationError:              return "Invalid request";
        case AuthError::NotFound:                     return "Invalid or expired OTP session";
        case AuthError::Expired:                      return "OTP has expired";
        case AuthError::AlreadyUsed:                  return "OTP has already been used";
        case AuthError::AttemptsExceeded:             return "Maximum OTP attempts exceeded";
        case AuthError::RateLimited:                  return "Too many requests";
        case AuthError::DecryptionFailed:             return "Decryption failed";
        case AuthError::CredentialNotFoundOrInactive: return "Credential not found or inactive";
        case AuthError::AssertionInvalid:             return "Authentication failed";
        case AuthError::CloneDetected:                return "Security violation detected: credential disabled";
        case AuthError::ConfigurationError:           return "Service misconfigured";
        case AuthError::InternalError:                return "Internal error";
    }
    return "Internal error";
}

// Short machine-readable code, used in audit details and CLI output
inline constexpr std::string_view error_code(AuthError error) noexcept {
    switch (error) {
        case AuthError::ValidationError:              return "validation_error";
        case AuthError::NotFound:                     return "not_found";
        case AuthError::Expired:                      return "expired";
        case AuthError::AlreadyUsed:                  return "already_used";
        case AuthError::AttemptsExceeded:             return "attempts_exceeded";
        case AuthError::RateLimited:                  return "rate_limited";
        case AuthError::DecryptionFailed:             return "decryption_failed";
        case AuthError::CredentialNotFoundOrInactive: return "credential_not_found_or_inactive";
        case AuthError::AssertionInvalid:             return "assertion_invalid";
        case AuthError::CloneDetected:                return "clone_detected";
        case AuthError::ConfigurationError:           return "configuration_error";
        case AuthError::InternalError:                return "internal_error";
    }
    return "internal_error";
}

// Whether the caller may retry the same operation (possibly after waiting)
inline constexpr bool is_retryable(AuthError error) noexcept {
    switch (error) {
        case AuthError::RateLimited:
        case AuthError::AssertionInvalid:
        case AuthError::InternalError:
            return true;
        default:
            return false;
    }
}

// Type alias for Result type
template<typename T = void>
using AuthResult = std::expected<T, AuthError>;

// Error as returned across the inbound API boundary.
// Carries the user-visible extras that are safe to disclose: retry timing
// for rate limiting and the remaining attempt budget for OTP verification.
struct AuthFailure {
    AuthError code{AuthError::InternalError};
    std::chrono::seconds retry_after{0};
    std::optional<uint32_t> attempts_remaining;

    [[nodiscard]] std::string_view message() const noexcept { return to_string(code); }
};

template<typename T>
using ApiResult = std::expected<T, AuthFailure>;

[[nodiscard]] inline AuthFailure make_failure(AuthError code) noexcept {
    return AuthFailure{code, std::chrono::seconds{0}, std::nullopt};
}

} // namespace AuthKeep

#endif // AUTHKEEP_AUTH_ERROR_H
