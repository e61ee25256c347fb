// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#ifndef AUTHKEEP_CREDENTIAL_CIPHER_H
#define AUTHKEEP_CREDENTIAL_CIPHER_H

#include "EncryptedBlob.h"
#include "KdfBackendProvider.h"
#include "KdfWorkerPool.h"
#include "../AuthError.h"
#include "../../utils/SecureMemory.h"
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>

namespace AuthKeep {

/**
 * @brief Passphrase-based authenticated encryption for stored secrets
 *
 * Turns a human passphrase into encryption and verification operations
 * without ever persisting the passphrase:
 * - Argon2id (or PBKDF2 fallback) key derivation on KdfWorkerPool
 * - AES-256-GCM with a fresh 256-bit salt and 96-bit IV per call
 * - Argon2id PHC hashes for passphrase verification
 *
 * The cipher holds no key material between calls; every operation derives
 * its own key into secure memory and drops it on return. It is safe to
 * share one instance across request threads.
 *
 * @section errors Error Reporting
 * decrypt() reports malformed input, wrong passphrase and tag mismatch
 * identically as AuthError::DecryptionFailed. A KDF timeout is reported as
 * AuthError::ConfigurationError.
 *
 * @section usage Usage Example
 * @code
 * KdfBackendProvider provider({});
 * KdfWorkerPool pool({});
 * CredentialCipher cipher(&provider, &pool, KdfParameters{});
 *
 * auto blob = cipher.encrypt("postgres://user:pw@db/auth", passphrase);
 * auto stored = blob->serialize();
 * auto plain = cipher.decrypt(stored, passphrase);
 * @endcode
 */
class CredentialCipher {
public:
    static constexpr size_t KEY_LENGTH = IKeyDerivationBackend::KEY_LENGTH;
    static constexpr uint32_t BACKUP_FORMAT_VERSION = 1;

    /**
     * @param provider Backend provider (non-owning, must outlive the cipher)
     * @param pool Worker pool for KDF calls (non-owning, must outlive the cipher)
     * @param params Parameters for new blobs and hashes; the algorithm field
     *        is replaced by the provider's preferred backend
     * @throws std::invalid_argument if provider or pool is null
     */
    CredentialCipher(KdfBackendProvider* provider, KdfWorkerPool* pool, KdfParameters params);

    CredentialCipher(const CredentialCipher&) = delete;
    CredentialCipher& operator=(const CredentialCipher&) = delete;
    CredentialCipher(CredentialCipher&&) = delete;
    CredentialCipher& operator=(CredentialCipher&&) = delete;

    /**
     * @brief Derive a 256-bit key on the worker pool
     * @return Key, or ValidationError / ConfigurationError / InternalError
     */
    [[nodiscard]] AuthResult<SecureVector<uint8_t>> derive_key(
        std::string_view passphrase,
        std::span<const uint8_t> salt,
        const KdfParameters& params);

    /**
     * @brief Encrypt with a freshly derived key
     *
     * Empty plaintext is valid.
     */
    [[nodiscard]] AuthResult<EncryptedBlob> encrypt(
        std::span<const uint8_t> plaintext,
        std::string_view passphrase);

    [[nodiscard]] AuthResult<EncryptedBlob> encrypt(
        std::string_view plaintext,
        std::string_view passphrase);

    /**
     * @brief Verify and decrypt in one step
     * @return Plaintext in secure memory, or DecryptionFailed
     */
    [[nodiscard]] AuthResult<SecureVector<uint8_t>> decrypt(
        const EncryptedBlob& blob,
        std::string_view passphrase);

    /**
     * @brief Parse a serialized blob and decrypt it
     */
    [[nodiscard]] AuthResult<SecureVector<uint8_t>> decrypt(
        std::string_view serialized,
        std::string_view passphrase);

    /**
     * @brief Check a passphrase against a stored hash
     * @return false on mismatch or any internal failure; never throws
     */
    [[nodiscard]] bool verify_passphrase(
        std::string_view passphrase,
        std::string_view stored_hash) noexcept;

    /**
     * @brief Produce a self-describing hash (Argon2id PHC string, or the
     *        PBKDF2 format when Argon2id is unavailable)
     */
    [[nodiscard]] AuthResult<std::string> hash_passphrase(std::string_view passphrase);

    /**
     * @brief Encrypt a set of named credentials as one backup string
     */
    [[nodiscard]] AuthResult<std::string> create_credential_backup(
        const std::map<std::string, std::string>& credentials,
        std::string_view passphrase);

    /**
     * @brief Restore credentials from create_credential_backup() output
     * @return Credentials, or DecryptionFailed for any failure
     */
    [[nodiscard]] AuthResult<std::map<std::string, std::string>> restore_credential_backup(
        std::string_view backup,
        std::string_view passphrase);

    /** @brief Parameters used for new data */
    [[nodiscard]] const KdfParameters& parameters() const noexcept { return m_params; }

private:
    [[nodiscard]] AuthResult<const IKeyDerivationBackend*> backend_for_new_data();

    [[nodiscard]] static bool seal(
        std::span<const uint8_t> key,
        std::span<const uint8_t> plaintext,
        EncryptedBlob& blob) noexcept;

    [[nodiscard]] static bool open(
        std::span<const uint8_t> key,
        const EncryptedBlob& blob,
        SecureVector<uint8_t>& plaintext) noexcept;

    KdfBackendProvider* m_provider;
    KdfWorkerPool* m_pool;
    KdfParameters m_params;
};

} // namespace AuthKeep

#endif // AUTHKEEP_CREDENTIAL_CIPHER_H
