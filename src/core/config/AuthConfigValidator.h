// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef AUTHKEEP_AUTH_CONFIG_VALIDATOR_H
#define AUTHKEEP_AUTH_CONFIG_VALIDATOR_H

#include "AuthConfig.h"
#include <string>
#include <vector>

namespace AuthKeep {

/**
 * @brief Findings from one validation pass
 */
struct ConfigValidationReport {
    std::vector<std::string> errors;     ///< Block startup
    std::vector<std::string> warnings;   ///< Logged, startup continues

    [[nodiscard]] bool ok() const noexcept { return errors.empty(); }
};

/**
 * @brief Validates and enforces security constraints on configuration values
 *
 * Argon2 cost parameters are checked against a fixed range. Outside it,
 * production startup fails; other environments get a warning and keep
 * the configured value so developers can run with cheap parameters.
 *
 * All other numeric settings are clamped into safe ranges at runtime,
 * with a warning for each value that had to move.
 *
 * @note This is a static utility class and cannot be instantiated.
 */
class AuthConfigValidator final {
public:
    static inline constexpr uint32_t MIN_ARGON2_MEMORY_COST_LOG2{12};   // 4 MiB
    static inline constexpr uint32_t MAX_ARGON2_MEMORY_COST_LOG2{18};   // 256 MiB
    static inline constexpr uint32_t RECOMMENDED_ARGON2_MEMORY_COST_LOG2{16};

    static inline constexpr uint32_t MIN_ARGON2_TIME_COST{2};
    static inline constexpr uint32_t MAX_ARGON2_TIME_COST{10};
    static inline constexpr uint32_t RECOMMENDED_ARGON2_TIME_COST{3};

    static inline constexpr uint32_t MIN_PBKDF2_ITERATIONS{KdfParameters::MIN_PBKDF2_ITERATIONS};
    static inline constexpr uint32_t MAX_PBKDF2_ITERATIONS{10000000};

    static inline constexpr int MIN_KDF_WORKERS{1};
    static inline constexpr int MAX_KDF_WORKERS{64};
    static inline constexpr int MIN_KDF_QUEUE{1};
    static inline constexpr int MAX_KDF_QUEUE{4096};
    static inline constexpr int MIN_KDF_TIMEOUT_MS{100};
    static inline constexpr int MAX_KDF_TIMEOUT_MS{60000};

    static inline constexpr int MIN_OTP_TTL_MINUTES{1};
    static inline constexpr int MAX_OTP_TTL_MINUTES{60};
    static inline constexpr int DEFAULT_OTP_TTL_MINUTES{5};

    static inline constexpr int MIN_SESSION_TTL_MINUTES{5};
    static inline constexpr int MAX_SESSION_TTL_MINUTES{1440};   // 1 day
    static inline constexpr int DEFAULT_SESSION_TTL_MINUTES{60};

    static inline constexpr uint32_t MIN_RATE_LIMIT{1};
    static inline constexpr uint32_t MAX_RATE_LIMIT{10000};

    static inline constexpr int MIN_WEBAUTHN_TIMEOUT_MS{10000};
    static inline constexpr int MAX_WEBAUTHN_TIMEOUT_MS{600000};
    static inline constexpr int MIN_CHALLENGE_TTL_MINUTES{1};
    static inline constexpr int MAX_CHALLENGE_TTL_MINUTES{60};

    /**
     * @brief Check and clamp a configuration in place
     */
    [[nodiscard]] static ConfigValidationReport validate(AuthConfig& config);

    /**
     * @brief validate() plus logging
     * @return ConfigurationError if the report has errors
     */
    [[nodiscard]] static AuthResult<void> validate_and_log(AuthConfig& config);

private:
    AuthConfigValidator() = delete;
    ~AuthConfigValidator() = delete;
    AuthConfigValidator(const AuthConfigValidator&) = delete;
    AuthConfigValidator& operator=(const AuthConfigValidator&) = delete;
    AuthConfigValidator(AuthConfigValidator&&) = delete;
    AuthConfigValidator& operator=(AuthConfigValidator&&) = delete;
};

} // namespace AuthKeep

#endif // AUTHKEEP_AUTH_CONFIG_VALIDATOR_H
