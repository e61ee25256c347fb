// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "KdfBackendProvider.h"

#include "../../utils/Log.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/provider.h>

#include <cstdlib>

namespace AuthKeep {

namespace {

struct OpenSslState {
    bool usable{false};
    bool fips_available{false};
    bool fips_enabled{false};
};

std::once_flag g_openssl_init;
OpenSslState g_openssl_state;
OSSL_PROVIDER* g_fips_provider{nullptr};
OSSL_PROVIDER* g_default_provider{nullptr};

void log_openssl_error(const char* context) {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return;
    }

    char err_buf[256];
    ERR_error_string_n(err, err_buf, sizeof(err_buf));
    Log::error("{}: OpenSSL error: {}", context, err_buf);
}

void openssl_cleanup_at_exit() {
    // Unload providers first, then clean up global OpenSSL state.
    if (g_default_provider != nullptr) {
        OSSL_PROVIDER_unload(g_default_provider);
        g_default_provider = nullptr;
    }
    if (g_fips_provider != nullptr) {
        OSSL_PROVIDER_unload(g_fips_provider);
        g_fips_provider = nullptr;
    }

    OPENSSL_cleanup();
}

// Process-wide: the first caller's fips request wins.
OpenSslState init_openssl(bool enable_fips) {
    std::call_once(g_openssl_init, [enable_fips]() {
        if (std::atexit(openssl_cleanup_at_exit) != 0) {
            Log::warning("Could not register OpenSSL cleanup handler");
        }

        // Load configuration file (honours OPENSSL_CONF).
        OPENSSL_init_crypto(OPENSSL_INIT_LOAD_CONFIG, nullptr);

        g_fips_provider = OSSL_PROVIDER_try_load(nullptr, "fips", 1);
        g_openssl_state.fips_available = g_fips_provider != nullptr;

        if (enable_fips) {
            if (!g_openssl_state.fips_available) {
                Log::error("FIPS mode requested but the FIPS provider is not available");
                return;
            }
            if (EVP_default_properties_enable_fips(nullptr, 1) != 1) {
                log_openssl_error("EVP_default_properties_enable_fips");
                return;
            }
            g_openssl_state.fips_enabled = true;
            g_openssl_state.usable = true;
            Log::info("FIPS mode enabled successfully");
            return;
        }

        g_default_provider = OSSL_PROVIDER_try_load(nullptr, "default", 1);
        if (g_default_provider == nullptr) {
            log_openssl_error("Failed to load default OpenSSL provider");
            return;
        }
        g_openssl_state.usable = true;
    });
    return g_openssl_state;
}

}  // namespace

KdfBackendProvider::KdfBackendProvider(KdfBackendOptions options) noexcept
    : m_options(options) {
}

void KdfBackendProvider::initialize() noexcept {
    std::call_once(m_init_flag, [this]() {
        m_init_count.fetch_add(1);

        const OpenSslState ssl = init_openssl(m_options.fips_mode);
        if (!ssl.usable) {
            Log::error("KdfBackendProvider: OpenSSL initialization failed");
            return;
        }
        m_fips_enabled = ssl.fips_enabled;

        // Argon2id is never used under FIPS, so do not even probe it
        m_argon2_ok = !m_fips_enabled && m_argon2.self_test();

        switch (m_options.preference) {
            case KdfBackendPreference::Pbkdf2:
                m_preferred = &m_pbkdf2;
                break;
            case KdfBackendPreference::Argon2id:
                if (!m_argon2_ok) {
                    Log::warning("KdfBackendProvider: Argon2id unavailable{}, falling back to PBKDF2",
                                 m_fips_enabled ? " in FIPS mode" : "");
                }
                m_preferred = m_argon2_ok ? static_cast<const IKeyDerivationBackend*>(&m_argon2)
                                        : &m_pbkdf2;
                break;
            case KdfBackendPreference::Auto:
                m_preferred = m_argon2_ok ? static_cast<const IKeyDerivationBackend*>(&m_argon2)
                                        : &m_pbkdf2;
                break;
        }

        m_initialized_ok = true;
        Log::info("KdfBackendProvider: using {} for new data (preference {}, FIPS {})",
                  to_string(m_preferred->algorithm()), to_string(m_options.preference),
                  m_fips_enabled ? "on" : "off");
    });
}

AuthResult<const IKeyDerivationBackend*> KdfBackendProvider::preferred() noexcept {
    initialize();
    if (!m_initialized_ok) {
        return std::unexpected(AuthError::ConfigurationError);
    }
    return m_preferred;
}

AuthResult<const IKeyDerivationBackend*> KdfBackendProvider::for_algorithm(KdfAlgorithm algorithm) noexcept {
    initialize();
    if (!m_initialized_ok) {
        return std::unexpected(AuthError::ConfigurationError);
    }
    switch (algorithm) {
        case KdfAlgorithm::PBKDF2_HMAC_SHA256:
            return &m_pbkdf2;
        case KdfAlgorithm::ARGON2ID:
            if (!m_argon2_ok) {
                Log::error("KdfBackendProvider: data requires Argon2id, which is unavailable");
                return std::unexpected(AuthError::ConfigurationError);
            }
            return &m_argon2;
    }
    return std::unexpected(AuthError::ConfigurationError);
}

AuthResult<const IKeyDerivationBackend*> KdfBackendProvider::for_encoded_hash(std::string_view encoded) noexcept {
    if (m_argon2.recognizes(encoded)) {
        return for_algorithm(KdfAlgorithm::ARGON2ID);
    }
    if (m_pbkdf2.recognizes(encoded)) {
        return for_algorithm(KdfAlgorithm::PBKDF2_HMAC_SHA256);
    }
    return std::unexpected(AuthError::ValidationError);
}

bool KdfBackendProvider::argon2_available() noexcept {
    initialize();
    return m_argon2_ok;
}

bool KdfBackendProvider::fips_enabled() noexcept {
    initialize();
    return m_fips_enabled;
}

} // namespace AuthKeep
