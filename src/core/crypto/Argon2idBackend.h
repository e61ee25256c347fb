// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Argon2idBackend.h
 * @brief Argon2id key derivation and passphrase hashing (RFC 9106)
 *
 * Argon2 is NOT part of OpenSSL; it is provided by libargon2.
 */

#pragma once

#include "KeyDerivationBackend.h"

namespace AuthKeep {

class Argon2idBackend final : public IKeyDerivationBackend {
public:
    /// Hard bounds enforced regardless of configuration (8 KiB .. 4 GiB)
    static constexpr uint32_t MIN_MEMORY_COST_LOG2 = 3;
    static constexpr uint32_t MAX_MEMORY_COST_LOG2 = 22;
    static constexpr uint32_t MAX_TIME_COST = 64;
    static constexpr size_t HASH_SALT_LENGTH = 16;

    [[nodiscard]] KdfAlgorithm algorithm() const noexcept override {
        return KdfAlgorithm::ARGON2ID;
    }

    [[nodiscard]] AuthResult<SecureVector<uint8_t>> derive_key(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        const KdfParameters& params) const noexcept override;

    /**
     * @brief PHC-format hash, e.g. "$argon2id$v=19$m=65536,t=3,p=1$salt$hash"
     */
    [[nodiscard]] AuthResult<std::string> hash_passphrase(
        std::string_view passphrase,
        const KdfParameters& params) const noexcept override;

    [[nodiscard]] bool verify_passphrase(
        std::string_view passphrase,
        std::string_view encoded_hash) const noexcept override;

    [[nodiscard]] bool recognizes(std::string_view encoded_hash) const noexcept override;

    /**
     * @brief Run a tiny derivation against a known input
     *
     * Used once at startup to decide whether Argon2id is usable on this
     * host before any request depends on it.
     */
    [[nodiscard]] bool self_test() const noexcept;

private:
    [[nodiscard]] static AuthResult<void> check_parameters(const KdfParameters& params) noexcept;
};

} // namespace AuthKeep
