// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Pbkdf2Backend.h
 * @brief PBKDF2-HMAC-SHA256 key derivation (NIST SP 800-132)
 *
 * Fallback used in FIPS mode or when Argon2id is unavailable. Iteration
 * counts below KdfParameters::MIN_PBKDF2_ITERATIONS are raised to it.
 *
 * Encoded hash format:
 *   $pbkdf2-sha256$i=<iterations>$<base64 salt>$<base64 hash>
 */

#pragma once

#include "KeyDerivationBackend.h"

namespace AuthKeep {

class Pbkdf2Backend final : public IKeyDerivationBackend {
public:
    static constexpr uint32_t MAX_ITERATIONS = 10000000;
    static constexpr size_t HASH_SALT_LENGTH = 16;

    [[nodiscard]] KdfAlgorithm algorithm() const noexcept override {
        return KdfAlgorithm::PBKDF2_HMAC_SHA256;
    }

    [[nodiscard]] AuthResult<SecureVector<uint8_t>> derive_key(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        const KdfParameters& params) const noexcept override;

    [[nodiscard]] AuthResult<std::string> hash_passphrase(
        std::string_view passphrase,
        const KdfParameters& params) const noexcept override;

    [[nodiscard]] bool verify_passphrase(
        std::string_view passphrase,
        std::string_view encoded_hash) const noexcept override;

    [[nodiscard]] bool recognizes(std::string_view encoded_hash) const noexcept override;

    /** @brief Iteration count actually used for the given parameters */
    [[nodiscard]] static uint32_t effective_iterations(const KdfParameters& params) noexcept;

private:
    [[nodiscard]] static AuthResult<SecureVector<uint8_t>> pbkdf2(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        uint32_t iterations) noexcept;
};

} // namespace AuthKeep
