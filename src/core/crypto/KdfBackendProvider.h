// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KdfBackendProvider.h
 * @brief One-time OpenSSL provider setup and KDF backend selection
 *
 * The provider is constructed explicitly and injected into CredentialCipher.
 * The first call to preferred() or for_algorithm() performs initialization
 * exactly once under std::call_once:
 *   1. Load the OpenSSL providers (fips and/or default). Providers and
 *      default properties are process-wide in OpenSSL, so this step runs
 *      once per process even if several providers are constructed.
 *   2. Run the Argon2id self-test.
 *   3. Choose the backend for new data from the configured preference.
 *
 * Every later call only reads the frozen result.
 */

#pragma once

#include "Argon2idBackend.h"
#include "Pbkdf2Backend.h"
#include <atomic>
#include <mutex>
#include <string_view>

namespace AuthKeep {

enum class KdfBackendPreference {
    Auto,       ///< Argon2id unless FIPS mode is on or the self-test fails
    Argon2id,   ///< Argon2id, falling back to PBKDF2 with a warning
    Pbkdf2      ///< Always PBKDF2
};

[[nodiscard]] constexpr std::string_view to_string(KdfBackendPreference pref) noexcept {
    switch (pref) {
        case KdfBackendPreference::Auto:     return "auto";
        case KdfBackendPreference::Argon2id: return "argon2id";
        case KdfBackendPreference::Pbkdf2:   return "pbkdf2";
    }
    return "auto";
}

struct KdfBackendOptions {
    KdfBackendPreference preference = KdfBackendPreference::Auto;
    bool fips_mode = false;   ///< Require the OpenSSL FIPS provider; forces PBKDF2
};

class KdfBackendProvider {
public:
    explicit KdfBackendProvider(KdfBackendOptions options) noexcept;

    KdfBackendProvider(const KdfBackendProvider&) = delete;
    KdfBackendProvider& operator=(const KdfBackendProvider&) = delete;
    KdfBackendProvider(KdfBackendProvider&&) = delete;
    KdfBackendProvider& operator=(KdfBackendProvider&&) = delete;

    /**
     * @brief Backend used for new blobs and hashes
     * @return ConfigurationError if initialization failed (e.g. FIPS mode
     *         requested but the FIPS provider is missing)
     */
    [[nodiscard]] AuthResult<const IKeyDerivationBackend*> preferred() noexcept;

    /**
     * @brief Backend for data written with the given algorithm
     * @return ConfigurationError if that algorithm is unusable here
     */
    [[nodiscard]] AuthResult<const IKeyDerivationBackend*> for_algorithm(KdfAlgorithm algorithm) noexcept;

    /**
     * @brief Backend able to verify the given encoded hash, if any
     */
    [[nodiscard]] AuthResult<const IKeyDerivationBackend*> for_encoded_hash(std::string_view encoded) noexcept;

    [[nodiscard]] bool argon2_available() noexcept;
    [[nodiscard]] bool fips_enabled() noexcept;

    /** @brief Number of times initialization actually ran (0 or 1) */
    [[nodiscard]] int initialization_count() const noexcept {
        return m_init_count.load();
    }

private:
    void initialize() noexcept;

    KdfBackendOptions m_options;
    Argon2idBackend m_argon2;
    Pbkdf2Backend m_pbkdf2;

    std::once_flag m_init_flag;
    std::atomic<int> m_init_count{0};
    bool m_initialized_ok{false};
    bool m_argon2_ok{false};
    bool m_fips_enabled{false};
    const IKeyDerivationBackend* m_preferred{nullptr};
};

} // namespace AuthKeep
