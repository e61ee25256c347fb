// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IdentifierHashService.h
 * @brief Hashing of identifiers, one-time codes and bearer tokens
 *
 * Responsibilities:
 * - SHA-256 of delivery identifiers so raw addresses are never stored
 * - Salted hashes of one-time codes
 * - Constant-time comparison of digests
 *
 * NOT responsible for:
 * - Passphrase hashing (see CredentialCipher)
 * - Code generation (see SecureRandom)
 *
 * FIPS Compliance:
 * - SHA-256: FIPS-approved (FIPS 180-4)
 */

#pragma once

#include "../AuthError.h"
#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace AuthKeep {

/**
 * @class IdentifierHashService
 * @brief Stateless hashing helpers
 *
 * All methods are static and thread-safe (no shared mutable state).
 *
 * @code
 * auto subject = IdentifierHashService::hash_identifier("user@example.com");
 * auto code_hash = IdentifierHashService::hash_code("482913", salt_hex);
 * bool ok = IdentifierHashService::verify_code("482913", salt_hex, *code_hash);
 * @endcode
 */
class IdentifierHashService {
public:
    static constexpr size_t DIGEST_LENGTH = 32;
    using Digest = std::array<uint8_t, DIGEST_LENGTH>;

    IdentifierHashService() = delete;

    /**
     * @brief SHA-256 of arbitrary bytes (EVP API)
     */
    [[nodiscard]] static AuthResult<Digest> sha256(std::span<const uint8_t> data) noexcept;

    /**
     * @brief SHA-256 of a string, lowercase hex
     */
    [[nodiscard]] static AuthResult<std::string> sha256_hex(std::string_view data) noexcept;

    /**
     * @brief Privacy-preserving subject hash of a delivery identifier
     *
     * The identifier is validated and trimmed first, so "user@example.com"
     * and " user@example.com " hash identically.
     *
     * @return Lowercase hex SHA-256, or ValidationError for an unusable identifier
     */
    [[nodiscard]] static AuthResult<std::string> hash_identifier(std::string_view identifier) noexcept;

    /**
     * @brief Salted hash of a one-time code
     *
     * SHA-256(code || salt || domain tag). The domain tag keeps code hashes
     * from colliding with any other SHA-256 use in the store.
     */
    [[nodiscard]] static AuthResult<std::string> hash_code(
        std::string_view code,
        std::string_view salt_hex) noexcept;

    /**
     * @brief Recompute and compare a code hash in constant time
     * @return false on mismatch or any hashing failure
     */
    [[nodiscard]] static bool verify_code(
        std::string_view code,
        std::string_view salt_hex,
        std::string_view stored_hash_hex) noexcept;

    /**
     * @brief Compare two byte sequences without data-dependent early exit
     *
     * Uses CRYPTO_memcmp, whose running time depends only on the length.
     * Inputs of different length compare unequal.
     */
    [[nodiscard]] static bool constant_time_compare(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    [[nodiscard]] static bool constant_time_compare(
        std::string_view a,
        std::string_view b) noexcept;

private:
    static constexpr std::string_view CODE_DOMAIN_TAG{"authkeep-otp-v1"};
};

} // namespace AuthKeep
