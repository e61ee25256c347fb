// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "AuthRuntime.h"
#include "config/AuthConfigValidator.h"
#include "delivery/LogCodeDelivery.h"
#include "delivery/SpoolCodeDelivery.h"
#include "repositories/DurableAuthStore.h"
#include "../utils/Log.h"

namespace AuthKeep {

AuthRuntime::AuthRuntime(AuthConfig config)
    : m_config(std::move(config)) {
}

AuthResult<std::unique_ptr<AuthRuntime>> AuthRuntime::create(
    const AuthConfig& config,
    const IAssertionVerifier* verifier,
    const IClock* clock) {

    AuthConfig validated = config;
    if (auto valid = AuthConfigValidator::validate_and_log(validated); !valid) {
        Log::error("Refusing to start with an invalid configuration");
        return std::unexpected(valid.error());
    }

    std::unique_ptr<AuthRuntime> runtime(new AuthRuntime(std::move(validated)));
    auto& rt = *runtime;
    const AuthConfig& cfg = rt.m_config;
    rt.m_clock = clock ? clock : &rt.m_system_clock;

    rt.m_kdf_provider = std::make_unique<KdfBackendProvider>(cfg.kdf_backend);
    rt.m_kdf_pool = std::make_unique<KdfWorkerPool>(cfg.kdf_pool);
    rt.m_cipher = std::make_unique<CredentialCipher>(rt.m_kdf_provider.get(), rt.m_kdf_pool.get(),
                                                     cfg.kdf_params);

    if (cfg.store_path.empty()) {
        Log::info("Using in-memory store; state is lost on exit");
        rt.m_store = std::make_unique<InMemoryAuthStore>();
    } else {
        auto durable = DurableAuthStore::open(cfg.store_path);
        if (!durable) {
            return std::unexpected(durable.error());
        }
        rt.m_store = std::move(*durable);
    }

    rt.m_audit = std::make_unique<FanoutAuditSink>(
        std::vector<IAuditSink*>{rt.m_store.get(), &rt.m_log_audit});

    if (cfg.spool_dir.empty()) {
        rt.m_delivery = std::make_unique<LogCodeDelivery>(cfg.production());
    } else {
        rt.m_delivery = std::make_unique<SpoolCodeDelivery>(cfg.spool_dir);
    }

    rt.m_rate_limiter = std::make_unique<RateLimiter>(rt.m_store.get(), rt.m_clock, cfg.rate_limits);
    rt.m_otp = std::make_unique<OtpSessionService>(rt.m_store.get(), rt.m_audit.get(), rt.m_clock);
    rt.m_webauthn = std::make_unique<CloneDetectionService>(rt.m_store.get(), verifier,
                                                            rt.m_audit.get(), rt.m_clock,
                                                            cfg.webauthn);

    AuthServiceSettings settings;
    settings.production = cfg.production();
    settings.otp_ttl = cfg.otp_ttl;
    settings.session_ttl = cfg.session_ttl;
    rt.m_auth = std::make_unique<AuthService>(rt.m_otp.get(), rt.m_rate_limiter.get(),
                                              rt.m_webauthn.get(), rt.m_store.get(),
                                              rt.m_delivery.get(), rt.m_audit.get(),
                                              rt.m_clock, settings);

    Log::info("AuthKeep runtime ready ({}, kdf backend {})",
              to_string(cfg.environment), to_string(cfg.kdf_backend.preference));
    return runtime;
}

} // namespace AuthKeep
