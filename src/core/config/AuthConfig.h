// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file AuthConfig.h
 * @brief Service configuration loaded from an INI-style key file
 *
 * Example:
 * @code
 * [service]
 * environment=production
 * log-level=info
 * store-path=/var/lib/authkeep/store.pb
 * spool-dir=/var/spool/authkeep
 *
 * [kdf]
 * backend=auto
 * memory-cost-log2=16
 * time-cost=3
 *
 * [webauthn]
 * rp-id=example.com
 * origins=https://example.com;https://www.example.com
 * @endcode
 *
 * Missing groups and keys keep their defaults. Environment variables
 * AUTHKEEP_ENV, AUTHKEEP_LOG_LEVEL, AUTHKEEP_ARGON2_MEMORY_COST and
 * AUTHKEEP_ARGON2_TIME_COST override the file.
 */

#pragma once

#include "../AuthError.h"
#include "../crypto/KdfBackendProvider.h"
#include "../crypto/KdfWorkerPool.h"
#include "../crypto/KeyDerivationBackend.h"
#include "../services/CloneDetectionService.h"
#include "../services/RateLimiter.h"
#include "../../utils/Log.h"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace AuthKeep {

enum class Environment {
    Development,
    Production
};

[[nodiscard]] constexpr std::string_view to_string(Environment env) noexcept {
    switch (env) {
        case Environment::Development: return "development";
        case Environment::Production:  return "production";
    }
    return "production";
}

[[nodiscard]] std::optional<Environment> parse_environment(std::string_view name) noexcept;
[[nodiscard]] std::optional<KdfBackendPreference> parse_kdf_backend(std::string_view name) noexcept;

struct AuthConfig {
    Environment environment{Environment::Production};
    Log::Level log_level{Log::Level::Info};
    std::filesystem::path store_path;     ///< Empty: in-memory store
    std::filesystem::path spool_dir;      ///< Empty: log delivery

    KdfBackendOptions kdf_backend;
    KdfParameters kdf_params;
    KdfWorkerPool::Options kdf_pool;

    std::chrono::minutes otp_ttl{5};
    RateLimitPolicies rate_limits;
    WebAuthnSettings webauthn;
    std::chrono::minutes session_ttl{60};

    [[nodiscard]] bool production() const noexcept { return environment == Environment::Production; }

    /**
     * @brief Load a key file and apply environment overrides
     *
     * Does not validate; run AuthConfigValidator::validate() on the result.
     *
     * @return Config, or ConfigurationError if the file cannot be read or a
     *         value has the wrong type
     */
    [[nodiscard]] static AuthResult<AuthConfig> load(const std::filesystem::path& path);

    /** @brief As load(), from in-memory key file text */
    [[nodiscard]] static AuthResult<AuthConfig> load_from_data(std::string_view data);

    /**
     * @brief Apply AUTHKEEP_* environment variables
     * @return ConfigurationError for an unparsable value
     */
    [[nodiscard]] AuthResult<void> apply_environment_overrides();
};

} // namespace AuthKeep
