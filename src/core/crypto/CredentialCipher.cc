// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "CredentialCipher.h"
#include "SecureRandom.h"
#include "../Clock.h"
#include "../../utils/Log.h"
#include "auth_records.pb.h"
#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>

namespace AuthKeep {

CredentialCipher::CredentialCipher(KdfBackendProvider* provider, KdfWorkerPool* pool, KdfParameters params)
    : m_provider(provider)
    , m_pool(pool)
    , m_params(params) {
    if (!m_provider) {
        throw std::invalid_argument("KdfBackendProvider cannot be null");
    }
    if (!m_pool) {
        throw std::invalid_argument("KdfWorkerPool cannot be null");
    }
}

AuthResult<const IKeyDerivationBackend*> CredentialCipher::backend_for_new_data() {
    return m_provider->preferred();
}

AuthResult<SecureVector<uint8_t>> CredentialCipher::derive_key(
    std::string_view passphrase,
    std::span<const uint8_t> salt,
    const KdfParameters& params) {

    if (salt.size() < IKeyDerivationBackend::MIN_SALT_LENGTH) {
        Log::error("CredentialCipher: Salt too short ({} bytes)", salt.size());
        return std::unexpected(AuthError::ValidationError);
    }

    auto backend = m_provider->for_algorithm(params.algorithm);
    if (!backend) {
        return std::unexpected(backend.error());
    }

    // The task may outlive this call on timeout, so it owns copies of its inputs
    const IKeyDerivationBackend* kdf = *backend;
    auto secret = std::make_shared<SecureString>(passphrase);
    std::vector<uint8_t> salt_copy(salt.begin(), salt.end());

    return m_pool->run<SecureVector<uint8_t>>(
        [kdf, secret, salt_copy = std::move(salt_copy), params]() {
            return kdf->derive_key(secret->view(), salt_copy, params);
        });
}

bool CredentialCipher::seal(
    std::span<const uint8_t> key,
    std::span<const uint8_t> plaintext,
    EncryptedBlob& blob) noexcept {

    if (key.size() != KEY_LENGTH) {
        return false;
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return false;
    }

    // Initialize AES-256-GCM, set IV length, then key and IV
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return false;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(blob.iv.size()), nullptr) != 1) {
        return false;
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), blob.iv.data()) != 1) {
        return false;
    }

    blob.ciphertext.assign(plaintext.size() + EVP_CIPHER_block_size(EVP_aes_256_gcm()), 0);
    int len = 0;
    int ciphertext_len = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), blob.ciphertext.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return false;
        }
        ciphertext_len = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), blob.ciphertext.data() + ciphertext_len, &len) != 1) {
        return false;
    }
    ciphertext_len += len;
    blob.ciphertext.resize(static_cast<size_t>(ciphertext_len));

    blob.tag.assign(EncryptedBlob::TAG_LENGTH, 0);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(EncryptedBlob::TAG_LENGTH), blob.tag.data()) != 1) {
        return false;
    }

    return true;
}

bool CredentialCipher::open(
    std::span<const uint8_t> key,
    const EncryptedBlob& blob,
    SecureVector<uint8_t>& plaintext) noexcept {

    if (key.size() != KEY_LENGTH) {
        return false;
    }

    EVPCipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return false;
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return false;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(blob.iv.size()), nullptr) != 1) {
        return false;
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), blob.iv.data()) != 1) {
        return false;
    }

    // Plaintext is staged in secure memory and only handed out after the tag verifies
    SecureVector<uint8_t> staged(blob.ciphertext.size() + EVP_CIPHER_block_size(EVP_aes_256_gcm()));
    int len = 0;
    int plaintext_len = 0;

    if (!blob.ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), staged.data(), &len,
                              blob.ciphertext.data(), static_cast<int>(blob.ciphertext.size())) != 1) {
            return false;
        }
        plaintext_len = len;
    }

    // Tag must be set before finalization; OpenSSL takes a non-const pointer
    std::vector<uint8_t> tag(blob.tag.begin(), blob.tag.end());
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tag.size()), tag.data()) != 1) {
        return false;
    }

    // Finalize (verifies authentication tag)
    if (EVP_DecryptFinal_ex(ctx.get(), staged.data() + plaintext_len, &len) != 1) {
        return false;
    }
    plaintext_len += len;

    staged.resize(static_cast<size_t>(plaintext_len));
    plaintext = std::move(staged);
    return true;
}

AuthResult<EncryptedBlob> CredentialCipher::encrypt(
    std::span<const uint8_t> plaintext,
    std::string_view passphrase) {

    auto backend = backend_for_new_data();
    if (!backend) {
        return std::unexpected(backend.error());
    }

    EncryptedBlob blob;
    blob.kdf = m_params.with_algorithm((*backend)->algorithm());
    blob.iv_length = EncryptedBlob::DEFAULT_IV_LENGTH;
    blob.salt.assign(EncryptedBlob::SALT_LENGTH, 0);
    blob.iv.assign(blob.iv_length, 0);

    // Fresh salt and IV on every call, so no (key, IV) pair ever repeats
    if (!SecureRandom::fill(blob.salt) || !SecureRandom::fill(blob.iv)) {
        Log::error("CredentialCipher: CSPRNG failure while generating salt/IV");
        return std::unexpected(AuthError::InternalError);
    }

    auto key = derive_key(passphrase, blob.salt, blob.kdf);
    if (!key) {
        return std::unexpected(key.error());
    }

    if (!seal(*key, plaintext, blob)) {
        Log::error("CredentialCipher: AES-256-GCM encryption failed");
        return std::unexpected(AuthError::InternalError);
    }

    return blob;
}

AuthResult<EncryptedBlob> CredentialCipher::encrypt(
    std::string_view plaintext,
    std::string_view passphrase) {
    return encrypt(std::span<const uint8_t>(
                       reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()),
                   passphrase);
}

AuthResult<SecureVector<uint8_t>> CredentialCipher::decrypt(
    const EncryptedBlob& blob,
    std::string_view passphrase) {

    if (blob.salt.size() != EncryptedBlob::SALT_LENGTH ||
        blob.iv_length < EncryptedBlob::MIN_IV_LENGTH ||
        blob.iv_length > EncryptedBlob::MAX_IV_LENGTH ||
        blob.iv.size() != blob.iv_length ||
        blob.tag.size() != EncryptedBlob::TAG_LENGTH) {
        Log::debug("CredentialCipher: rejecting malformed blob");
        return std::unexpected(AuthError::DecryptionFailed);
    }

    auto key = derive_key(passphrase, blob.salt, blob.kdf);
    if (!key) {
        // Timeouts and unusable parameters are operator problems, not oracle signals
        if (key.error() == AuthError::ConfigurationError) {
            return std::unexpected(AuthError::ConfigurationError);
        }
        return std::unexpected(AuthError::DecryptionFailed);
    }

    SecureVector<uint8_t> plaintext;
    if (!open(*key, blob, plaintext)) {
        Log::debug("CredentialCipher: authentication failed during decryption");
        return std::unexpected(AuthError::DecryptionFailed);
    }
    return plaintext;
}

AuthResult<SecureVector<uint8_t>> CredentialCipher::decrypt(
    std::string_view serialized,
    std::string_view passphrase) {

    // A bare body carries no descriptor and is read with the current parameters
    auto backend = backend_for_new_data();
    if (!backend) {
        return std::unexpected(backend.error());
    }

    auto blob = EncryptedBlob::parse(serialized, m_params.with_algorithm((*backend)->algorithm()));
    if (!blob) {
        Log::debug("CredentialCipher: rejecting unparsable blob");
        return std::unexpected(AuthError::DecryptionFailed);
    }
    return decrypt(*blob, passphrase);
}

bool CredentialCipher::verify_passphrase(
    std::string_view passphrase,
    std::string_view stored_hash) noexcept {

    try {
        auto backend = m_provider->for_encoded_hash(stored_hash);
        if (!backend) {
            return false;
        }

        const IKeyDerivationBackend* kdf = *backend;
        auto secret = std::make_shared<SecureString>(passphrase);
        std::string hash_copy(stored_hash);

        auto verified = m_pool->run<bool>([kdf, secret, hash_copy = std::move(hash_copy)]() -> AuthResult<bool> {
            return kdf->verify_passphrase(secret->view(), hash_copy);
        });
        return verified.value_or(false);
    } catch (const std::exception& e) {
        Log::error("CredentialCipher: passphrase verification failed: {}", e.what());
        return false;
    }
}

AuthResult<std::string> CredentialCipher::hash_passphrase(std::string_view passphrase) {
    auto backend = backend_for_new_data();
    if (!backend) {
        return std::unexpected(backend.error());
    }

    const IKeyDerivationBackend* kdf = *backend;
    auto secret = std::make_shared<SecureString>(passphrase);
    const KdfParameters params = m_params.with_algorithm(kdf->algorithm());

    return m_pool->run<std::string>([kdf, secret, params]() {
        return kdf->hash_passphrase(secret->view(), params);
    });
}

AuthResult<std::string> CredentialCipher::create_credential_backup(
    const std::map<std::string, std::string>& credentials,
    std::string_view passphrase) {

    authkeep::CredentialSet set;
    set.set_version(BACKUP_FORMAT_VERSION);
    set.set_created_at(to_epoch_ms(std::chrono::system_clock::now()));
    for (const auto& [name, value] : credentials) {
        (*set.mutable_entries())[name] = value;
    }

    std::string payload;
    const bool serialized = set.SerializeToString(&payload);
    for (auto& entry : *set.mutable_entries()) {
        secure_clear_string(entry.second);
    }
    if (!serialized) {
        Log::error("CredentialCipher: failed to serialize credential backup");
        return std::unexpected(AuthError::InternalError);
    }

    auto blob = encrypt(std::span<const uint8_t>(
                            reinterpret_cast<const uint8_t*>(payload.data()), payload.size()),
                        passphrase);
    secure_clear_string(payload);
    if (!blob) {
        return std::unexpected(blob.error());
    }

    Log::info("CredentialCipher: created backup of {} credentials", credentials.size());
    return blob->serialize();
}

AuthResult<std::map<std::string, std::string>> CredentialCipher::restore_credential_backup(
    std::string_view backup,
    std::string_view passphrase) {

    auto plaintext = decrypt(backup, passphrase);
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }

    authkeep::CredentialSet set;
    if (!set.ParseFromArray(plaintext->data(), static_cast<int>(plaintext->size())) ||
        set.version() != BACKUP_FORMAT_VERSION) {
        Log::warning("CredentialCipher: backup payload is not a credential set");
        return std::unexpected(AuthError::DecryptionFailed);
    }

    std::map<std::string, std::string> credentials;
    for (auto& entry : *set.mutable_entries()) {
        credentials.emplace(entry.first, entry.second);
        secure_clear_string(entry.second);
    }
    return credentials;
}

} // namespace AuthKeep
