// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file AuthRuntime.h
 * @brief Owns and wires every component for one configuration
 *
 * Members are declared in dependency order so destruction runs in
 * reverse: the KDF worker pool drains before the backend provider it
 * calls into goes away, and services go before the store they point to.
 */

#pragma once

#include "AuthError.h"
#include "Clock.h"
#include "audit/IAuditSink.h"
#include "config/AuthConfig.h"
#include "crypto/CredentialCipher.h"
#include "crypto/KdfBackendProvider.h"
#include "crypto/KdfWorkerPool.h"
#include "delivery/ICodeDelivery.h"
#include "repositories/InMemoryAuthStore.h"
#include "services/AuthService.h"
#include "services/CloneDetectionService.h"
#include "services/OtpSessionService.h"
#include "services/RateLimiter.h"
#include <memory>

namespace AuthKeep {

class AuthRuntime {
public:
    /**
     * @brief Validate a configuration and build all components from it
     *
     * The configuration is checked and clamped by AuthConfigValidator
     * first; findings are logged and any error refuses startup.
     * config() returns the clamped copy.
     *
     * Uses DurableAuthStore when store_path is set, otherwise an in-memory
     * store; SpoolCodeDelivery when spool_dir is set, otherwise
     * LogCodeDelivery.
     *
     * @param config Configuration as loaded
     * @param verifier Non-owning FIDO2 verifier; must outlive the runtime
     * @param clock Non-owning clock, or nullptr for the system clock
     * @return Runtime, ConfigurationError if validation fails (for example
     *         out-of-range Argon2 costs in production), or the store's
     *         open error
     */
    [[nodiscard]] static AuthResult<std::unique_ptr<AuthRuntime>> create(
        const AuthConfig& config,
        const IAssertionVerifier* verifier,
        const IClock* clock = nullptr);

    AuthRuntime(const AuthRuntime&) = delete;
    AuthRuntime& operator=(const AuthRuntime&) = delete;
    AuthRuntime(AuthRuntime&&) = delete;
    AuthRuntime& operator=(AuthRuntime&&) = delete;

    [[nodiscard]] AuthService& auth() noexcept { return *m_auth; }
    [[nodiscard]] CredentialCipher& cipher() noexcept { return *m_cipher; }
    [[nodiscard]] KdfBackendProvider& kdf_provider() noexcept { return *m_kdf_provider; }
    [[nodiscard]] InMemoryAuthStore& store() noexcept { return *m_store; }
    [[nodiscard]] const AuthConfig& config() const noexcept { return m_config; }

private:
    explicit AuthRuntime(AuthConfig config);

    AuthConfig m_config;
    SystemClock m_system_clock;
    const IClock* m_clock{nullptr};

    std::unique_ptr<KdfBackendProvider> m_kdf_provider;
    std::unique_ptr<KdfWorkerPool> m_kdf_pool;
    std::unique_ptr<CredentialCipher> m_cipher;

    std::unique_ptr<InMemoryAuthStore> m_store;
    LogAuditSink m_log_audit;
    std::unique_ptr<FanoutAuditSink> m_audit;
    std::unique_ptr<ICodeDelivery> m_delivery;

    std::unique_ptr<RateLimiter> m_rate_limiter;
    std::unique_ptr<OtpSessionService> m_otp;
    std::unique_ptr<CloneDetectionService> m_webauthn;
    std::unique_ptr<AuthService> m_auth;
};

} // namespace AuthKeep
