// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file KeyDerivationBackend.h
 * @brief Password-based key derivation backends
 *
 * Two implementations exist:
 * - Argon2idBackend: memory-hard, the default (libargon2)
 * - Pbkdf2Backend: PBKDF2-HMAC-SHA256, used in FIPS mode or when the
 *   Argon2id self-test fails at startup (OpenSSL)
 *
 * The backend for new data is chosen once by KdfBackendProvider. Existing
 * blobs and hashes carry their own parameters, so either backend may still
 * be asked to derive for data written under a previous configuration.
 *
 * FIPS Compliance:
 * - PBKDF2-HMAC-SHA256: FIPS-approved (NIST SP 800-132)
 * - Argon2id: NOT FIPS-approved (never selected in FIPS mode)
 */

#pragma once

#include "../AuthError.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace AuthKeep {

/**
 * @brief Key derivation algorithm identifiers
 */
enum class KdfAlgorithm : uint8_t {
    PBKDF2_HMAC_SHA256 = 0x04,  ///< FIPS-approved fallback
    ARGON2ID = 0x05             ///< Memory-hard default (not FIPS)
};

[[nodiscard]] constexpr std::string_view to_string(KdfAlgorithm algorithm) noexcept {
    switch (algorithm) {
        case KdfAlgorithm::PBKDF2_HMAC_SHA256: return "pbkdf2-sha256";
        case KdfAlgorithm::ARGON2ID:           return "argon2id";
    }
    return "unknown";
}

/**
 * @brief Algorithm-specific parameters
 *
 * Argon2 memory cost is expressed as a base-2 exponent of KiB, so the
 * default of 16 means 64 MiB.
 */
struct KdfParameters {
    static constexpr uint32_t MIN_PBKDF2_ITERATIONS = 100000;

    KdfAlgorithm algorithm = KdfAlgorithm::ARGON2ID;
    uint32_t argon2_memory_cost_log2 = 16;   ///< KiB = 2^exponent
    uint32_t argon2_time_cost = 3;           ///< Passes over memory
    uint32_t argon2_parallelism = 1;         ///< Lanes (fixed at 1)
    uint32_t pbkdf2_iterations = 600000;     ///< Never below MIN_PBKDF2_ITERATIONS

    [[nodiscard]] uint32_t argon2_memory_kib() const noexcept {
        return uint32_t{1} << argon2_memory_cost_log2;
    }

    /** @brief Same parameters with the algorithm switched */
    [[nodiscard]] KdfParameters with_algorithm(KdfAlgorithm alg) const noexcept {
        KdfParameters copy = *this;
        copy.algorithm = alg;
        return copy;
    }

    bool operator==(const KdfParameters&) const = default;
};

/**
 * @brief Abstract key derivation backend
 *
 * Implementations are stateless and re-entrant. They are invoked from
 * KdfWorkerPool threads, never from request dispatch.
 */
class IKeyDerivationBackend {
public:
    static constexpr size_t KEY_LENGTH = 32;       ///< 256-bit derived keys
    static constexpr size_t MIN_SALT_LENGTH = 16;

    virtual ~IKeyDerivationBackend() = default;

    [[nodiscard]] virtual KdfAlgorithm algorithm() const noexcept = 0;

    /**
     * @brief Derive a 256-bit key
     * @param passphrase Passphrase bytes (UTF-8)
     * @param salt At least MIN_SALT_LENGTH bytes
     * @param params Parameters recorded alongside the data being protected
     * @return Key in secure memory, ValidationError for a short salt,
     *         ConfigurationError for unusable parameters, InternalError for
     *         a library failure
     */
    [[nodiscard]] virtual AuthResult<SecureVector<uint8_t>> derive_key(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        const KdfParameters& params) const noexcept = 0;

    /**
     * @brief Produce a self-describing hash string for later verification
     */
    [[nodiscard]] virtual AuthResult<std::string> hash_passphrase(
        std::string_view passphrase,
        const KdfParameters& params) const noexcept = 0;

    /**
     * @brief Check a passphrase against a string from hash_passphrase()
     * @return false on mismatch and on any malformed input
     */
    [[nodiscard]] virtual bool verify_passphrase(
        std::string_view passphrase,
        std::string_view encoded_hash) const noexcept = 0;

    /** @brief Whether encoded_hash uses this backend's format */
    [[nodiscard]] virtual bool recognizes(std::string_view encoded_hash) const noexcept = 0;
};

} // namespace AuthKeep
