// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "AuthConfig.h"

#include <glibmm/keyfile.h>
#include <glibmm/error.h>

#include <charconv>
#include <cstdlib>

namespace AuthKeep {

namespace {

constexpr const char* GROUP_SERVICE = "service";
constexpr const char* GROUP_KDF = "kdf";
constexpr const char* GROUP_OTP = "otp";
constexpr const char* GROUP_RATE_LIMITS = "rate-limits";
constexpr const char* GROUP_WEBAUTHN = "webauthn";
constexpr const char* GROUP_SESSION = "session";

bool has(const Glib::RefPtr<Glib::KeyFile>& keyfile, const char* group, const char* key) {
    return keyfile->has_group(group) && keyfile->has_key(group, key);
}

// Missing keys leave the target untouched; a non-integer throws Glib::KeyFileError
void read_int(const Glib::RefPtr<Glib::KeyFile>& keyfile, const char* group, const char* key,
              int& target) {
    if (has(keyfile, group, key)) {
        target = keyfile->get_integer(group, key);
    }
}

template<typename Rep, typename Period>
void read_duration(const Glib::RefPtr<Glib::KeyFile>& keyfile, const char* group, const char* key,
                   std::chrono::duration<Rep, Period>& target) {
    int value = static_cast<int>(target.count());
    read_int(keyfile, group, key, value);
    target = std::chrono::duration<Rep, Period>{value};
}

void read_unsigned(const Glib::RefPtr<Glib::KeyFile>& keyfile, const char* group, const char* key,
                   uint32_t& target) {
    int value = static_cast<int>(target);
    read_int(keyfile, group, key, value);
    target = value < 0 ? 0 : static_cast<uint32_t>(value);
}

std::optional<int> parse_int(std::string_view text) {
    int value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

AuthResult<AuthConfig> from_keyfile(const Glib::RefPtr<Glib::KeyFile>& keyfile) {
    AuthConfig config;

    // [service]
    if (has(keyfile, GROUP_SERVICE, "environment")) {
        const std::string value = keyfile->get_string(GROUP_SERVICE, "environment").raw();
        auto env = parse_environment(value);
        if (!env) {
            Log::error("Config: unknown environment '{}'", value);
            return std::unexpected(AuthError::ConfigurationError);
        }
        config.environment = *env;
    }
    if (has(keyfile, GROUP_SERVICE, "log-level")) {
        const std::string value = keyfile->get_string(GROUP_SERVICE, "log-level").raw();
        auto level = Log::parse_level(value);
        if (!level) {
            Log::error("Config: unknown log level '{}'", value);
            return std::unexpected(AuthError::ConfigurationError);
        }
        config.log_level = *level;
    }
    if (has(keyfile, GROUP_SERVICE, "store-path")) {
        config.store_path = keyfile->get_string(GROUP_SERVICE, "store-path").raw();
    }
    if (has(keyfile, GROUP_SERVICE, "spool-dir")) {
        config.spool_dir = keyfile->get_string(GROUP_SERVICE, "spool-dir").raw();
    }

    // [kdf]
    if (has(keyfile, GROUP_KDF, "backend")) {
        const std::string value = keyfile->get_string(GROUP_KDF, "backend").raw();
        auto backend = parse_kdf_backend(value);
        if (!backend) {
            Log::error("Config: unknown kdf backend '{}'", value);
            return std::unexpected(AuthError::ConfigurationError);
        }
        config.kdf_backend.preference = *backend;
    }
    if (has(keyfile, GROUP_KDF, "fips-mode")) {
        config.kdf_backend.fips_mode = keyfile->get_boolean(GROUP_KDF, "fips-mode");
    }
    read_unsigned(keyfile, GROUP_KDF, "memory-cost-log2", config.kdf_params.argon2_memory_cost_log2);
    read_unsigned(keyfile, GROUP_KDF, "time-cost", config.kdf_params.argon2_time_cost);
    read_unsigned(keyfile, GROUP_KDF, "pbkdf2-iterations", config.kdf_params.pbkdf2_iterations);

    int workers = static_cast<int>(config.kdf_pool.workers);
    int queue_capacity = static_cast<int>(config.kdf_pool.queue_capacity);
    read_int(keyfile, GROUP_KDF, "workers", workers);
    read_int(keyfile, GROUP_KDF, "queue-capacity", queue_capacity);
    config.kdf_pool.workers = workers < 0 ? 0 : static_cast<size_t>(workers);
    config.kdf_pool.queue_capacity = queue_capacity < 0 ? 0 : static_cast<size_t>(queue_capacity);
    read_duration(keyfile, GROUP_KDF, "timeout-ms", config.kdf_pool.timeout);

    // [otp]
    read_duration(keyfile, GROUP_OTP, "ttl-minutes", config.otp_ttl);

    // [rate-limits]
    read_unsigned(keyfile, GROUP_RATE_LIMITS, "initiate-per-ip-hour", config.rate_limits.initiate_per_ip.limit);
    read_unsigned(keyfile, GROUP_RATE_LIMITS, "initiate-per-identifier-hour",
                  config.rate_limits.initiate_per_identifier.limit);
    read_unsigned(keyfile, GROUP_RATE_LIMITS, "verify-per-session-minute",
                  config.rate_limits.verify_per_session.limit);
    read_unsigned(keyfile, GROUP_RATE_LIMITS, "verify-per-ip-minute", config.rate_limits.verify_per_ip.limit);

    // [webauthn]
    if (has(keyfile, GROUP_WEBAUTHN, "rp-id")) {
        config.webauthn.rp_id = keyfile->get_string(GROUP_WEBAUTHN, "rp-id").raw();
    }
    if (has(keyfile, GROUP_WEBAUTHN, "origins")) {
        config.webauthn.origins.clear();
        for (const auto& origin : keyfile->get_string_list(GROUP_WEBAUTHN, "origins")) {
            config.webauthn.origins.emplace_back(origin.raw());
        }
    }
    read_duration(keyfile, GROUP_WEBAUTHN, "timeout-ms", config.webauthn.timeout);
    read_duration(keyfile, GROUP_WEBAUTHN, "challenge-ttl-minutes", config.webauthn.challenge_ttl);

    // [session]
    read_duration(keyfile, GROUP_SESSION, "ttl-minutes", config.session_ttl);

    if (auto overridden = config.apply_environment_overrides(); !overridden) {
        return std::unexpected(overridden.error());
    }
    return config;
}

} // namespace

std::optional<Environment> parse_environment(std::string_view name) noexcept {
    if (name == "production" || name == "prod") return Environment::Production;
    if (name == "development" || name == "dev" || name == "test") return Environment::Development;
    return std::nullopt;
}

std::optional<KdfBackendPreference> parse_kdf_backend(std::string_view name) noexcept {
    if (name == "auto") return KdfBackendPreference::Auto;
    if (name == "argon2id") return KdfBackendPreference::Argon2id;
    if (name == "pbkdf2") return KdfBackendPreference::Pbkdf2;
    return std::nullopt;
}

AuthResult<AuthConfig> AuthConfig::load(const std::filesystem::path& path) {
    try {
        auto keyfile = Glib::KeyFile::create();
        keyfile->load_from_file(path.string());
        Log::debug("Config: loaded {}", path.string());
        return from_keyfile(keyfile);
    } catch (const Glib::Error& e) {
        Log::error("Config: failed to load {}: {}", path.string(), e.what());
        return std::unexpected(AuthError::ConfigurationError);
    }
}

AuthResult<AuthConfig> AuthConfig::load_from_data(std::string_view data) {
    try {
        auto keyfile = Glib::KeyFile::create();
        keyfile->load_from_data(Glib::ustring(std::string(data)));
        return from_keyfile(keyfile);
    } catch (const Glib::Error& e) {
        Log::error("Config: failed to parse configuration: {}", e.what());
        return std::unexpected(AuthError::ConfigurationError);
    }
}

AuthResult<void> AuthConfig::apply_environment_overrides() {
    if (const char* env = std::getenv("AUTHKEEP_ENV"); env && *env) {
        auto parsed = parse_environment(env);
        if (!parsed) {
            Log::error("Config: AUTHKEEP_ENV has unknown value '{}'", env);
            return std::unexpected(AuthError::ConfigurationError);
        }
        environment = *parsed;
    }
    if (const char* level = std::getenv("AUTHKEEP_LOG_LEVEL"); level && *level) {
        auto parsed = Log::parse_level(level);
        if (!parsed) {
            Log::error("Config: AUTHKEEP_LOG_LEVEL has unknown value '{}'", level);
            return std::unexpected(AuthError::ConfigurationError);
        }
        log_level = *parsed;
    }
    if (const char* memory = std::getenv("AUTHKEEP_ARGON2_MEMORY_COST"); memory && *memory) {
        auto parsed = parse_int(memory);
        if (!parsed || *parsed < 0) {
            Log::error("Config: AUTHKEEP_ARGON2_MEMORY_COST is not a non-negative integer");
            return std::unexpected(AuthError::ConfigurationError);
        }
        kdf_params.argon2_memory_cost_log2 = static_cast<uint32_t>(*parsed);
    }
    if (const char* time = std::getenv("AUTHKEEP_ARGON2_TIME_COST"); time && *time) {
        auto parsed = parse_int(time);
        if (!parsed || *parsed < 0) {
            Log::error("Config: AUTHKEEP_ARGON2_TIME_COST is not a non-negative integer");
            return std::unexpected(AuthError::ConfigurationError);
        }
        kdf_params.argon2_time_cost = static_cast<uint32_t>(*parsed);
    }
    return {};
}

} // namespace AuthKeep
