// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "AuthConfigValidator.h"

#include <algorithm>
#include <format>

namespace AuthKeep {

namespace {

template<typename T>
void clamp_setting(ConfigValidationReport& report, std::string_view name, T& value, T low, T high) {
    const T clamped = std::clamp(value, low, high);
    if (clamped != value) {
        report.warnings.push_back(std::format("{} = {} is outside [{}, {}]; using {}",
                                              name, value, low, high, clamped));
        value = clamped;
    }
}

template<typename Duration>
void clamp_duration(ConfigValidationReport& report, std::string_view name, Duration& value,
                    int low, int high) {
    auto count = static_cast<int64_t>(value.count());
    clamp_setting<int64_t>(report, name, count, low, high);
    value = Duration{count};
}

void clamp_limit(ConfigValidationReport& report, std::string_view name, RateLimitPolicy& policy) {
    clamp_setting(report, name, policy.limit,
                  AuthConfigValidator::MIN_RATE_LIMIT, AuthConfigValidator::MAX_RATE_LIMIT);
}

} // namespace

ConfigValidationReport AuthConfigValidator::validate(AuthConfig& config) {
    ConfigValidationReport report;
    const bool production = config.production();
    auto& params = config.kdf_params;

    // Argon2 costs: hard range, enforced only in production
    auto range_finding = [&](std::string message) {
        if (production) {
            report.errors.push_back(std::move(message));
        } else {
            report.warnings.push_back(std::move(message));
        }
    };
    if (params.argon2_memory_cost_log2 < MIN_ARGON2_MEMORY_COST_LOG2 ||
        params.argon2_memory_cost_log2 > MAX_ARGON2_MEMORY_COST_LOG2) {
        range_finding(std::format("kdf.memory-cost-log2 = {} is outside [{}, {}]",
                                  params.argon2_memory_cost_log2,
                                  MIN_ARGON2_MEMORY_COST_LOG2, MAX_ARGON2_MEMORY_COST_LOG2));
    }
    if (params.argon2_time_cost < MIN_ARGON2_TIME_COST || params.argon2_time_cost > MAX_ARGON2_TIME_COST) {
        range_finding(std::format("kdf.time-cost = {} is outside [{}, {}]",
                                  params.argon2_time_cost, MIN_ARGON2_TIME_COST, MAX_ARGON2_TIME_COST));
    }
    if (production && report.ok()) {
        if (params.argon2_memory_cost_log2 < RECOMMENDED_ARGON2_MEMORY_COST_LOG2) {
            report.warnings.push_back(std::format(
                "kdf.memory-cost-log2 = {} is below the recommended {} for production",
                params.argon2_memory_cost_log2, RECOMMENDED_ARGON2_MEMORY_COST_LOG2));
        }
        if (params.argon2_time_cost < RECOMMENDED_ARGON2_TIME_COST) {
            report.warnings.push_back(std::format(
                "kdf.time-cost = {} is below the recommended {} for production",
                params.argon2_time_cost, RECOMMENDED_ARGON2_TIME_COST));
        }
    }
    if (params.argon2_parallelism != 1) {
        report.warnings.push_back("kdf parallelism is fixed at 1");
        params.argon2_parallelism = 1;
    }

    clamp_setting(report, "kdf.pbkdf2-iterations", params.pbkdf2_iterations,
                  MIN_PBKDF2_ITERATIONS, MAX_PBKDF2_ITERATIONS);

    if (config.kdf_backend.fips_mode && config.kdf_backend.preference == KdfBackendPreference::Argon2id) {
        report.warnings.push_back("kdf.backend = argon2id is not FIPS-approved; PBKDF2 will be used");
    }

    auto workers = static_cast<int64_t>(config.kdf_pool.workers);
    clamp_setting<int64_t>(report, "kdf.workers", workers, MIN_KDF_WORKERS, MAX_KDF_WORKERS);
    config.kdf_pool.workers = static_cast<size_t>(workers);

    auto queue = static_cast<int64_t>(config.kdf_pool.queue_capacity);
    clamp_setting<int64_t>(report, "kdf.queue-capacity", queue, MIN_KDF_QUEUE, MAX_KDF_QUEUE);
    config.kdf_pool.queue_capacity = static_cast<size_t>(queue);

    clamp_duration(report, "kdf.timeout-ms", config.kdf_pool.timeout, MIN_KDF_TIMEOUT_MS, MAX_KDF_TIMEOUT_MS);
    clamp_duration(report, "otp.ttl-minutes", config.otp_ttl, MIN_OTP_TTL_MINUTES, MAX_OTP_TTL_MINUTES);
    clamp_duration(report, "session.ttl-minutes", config.session_ttl,
                   MIN_SESSION_TTL_MINUTES, MAX_SESSION_TTL_MINUTES);

    clamp_limit(report, "rate-limits.initiate-per-ip-hour", config.rate_limits.initiate_per_ip);
    clamp_limit(report, "rate-limits.initiate-per-identifier-hour", config.rate_limits.initiate_per_identifier);
    clamp_limit(report, "rate-limits.verify-per-session-minute", config.rate_limits.verify_per_session);
    clamp_limit(report, "rate-limits.verify-per-ip-minute", config.rate_limits.verify_per_ip);

    clamp_duration(report, "webauthn.timeout-ms", config.webauthn.timeout,
                   MIN_WEBAUTHN_TIMEOUT_MS, MAX_WEBAUTHN_TIMEOUT_MS);
    clamp_duration(report, "webauthn.challenge-ttl-minutes", config.webauthn.challenge_ttl,
                   MIN_CHALLENGE_TTL_MINUTES, MAX_CHALLENGE_TTL_MINUTES);

    if (config.webauthn.rp_id.empty()) {
        report.errors.push_back("webauthn.rp-id must not be empty");
    }
    if (config.webauthn.origins.empty()) {
        report.errors.push_back("webauthn.origins must list at least one origin");
    }

    return report;
}

AuthResult<void> AuthConfigValidator::validate_and_log(AuthConfig& config) {
    const auto report = validate(config);
    for (const auto& warning : report.warnings) {
        Log::warning("Config: {}", warning);
    }
    for (const auto& error : report.errors) {
        Log::error("Config: {}", error);
    }
    if (!report.ok()) {
        return std::unexpected(AuthError::ConfigurationError);
    }
    return {};
}

} // namespace AuthKeep
