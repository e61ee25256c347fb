// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "../src/core/crypto/CredentialCipher.h"
#include "../src/utils/Encoding.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <map>

using namespace AuthKeep;
using namespace AuthKeep::Testing;
using namespace std::chrono_literals;

namespace {

std::string to_text(const SecureVector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

class CredentialCipherTest : public ::testing::Test {
protected:
    KdfBackendProvider provider{KdfBackendOptions{KdfBackendPreference::Auto, false}};
    KdfWorkerPool pool{KdfWorkerPool::Options{2, 16, 30000ms}};
    CredentialCipher cipher{&provider, &pool, fast_kdf_parameters()};
};

// ============================================================================
// Encryption round trip
// ============================================================================

TEST_F(CredentialCipherTest, EncryptThenDecrypt) {
    auto blob = cipher.encrypt("smtp-password-123", "relay passphrase");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->salt.size(), EncryptedBlob::SALT_LENGTH);
    EXPECT_EQ(blob->iv.size(), EncryptedBlob::DEFAULT_IV_LENGTH);
    EXPECT_EQ(blob->tag.size(), EncryptedBlob::TAG_LENGTH);
    EXPECT_EQ(blob->ciphertext.size(), std::string("smtp-password-123").size());

    auto plaintext = cipher.decrypt(*blob, "relay passphrase");
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(to_text(*plaintext), "smtp-password-123");
}

TEST_F(CredentialCipherTest, SerializedFormRoundTrips) {
    auto blob = cipher.encrypt("api-key", "pw");
    ASSERT_TRUE(blob.has_value());

    const std::string serialized = blob->serialize();
    EXPECT_TRUE(serialized.starts_with("argon2id:m=12,t=2,p=1,iv=12$"));

    auto plaintext = cipher.decrypt(serialized, "pw");
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(to_text(*plaintext), "api-key");
}

TEST_F(CredentialCipherTest, BareBodyUsesCurrentParameters) {
    auto blob = cipher.encrypt("api-key", "pw");
    ASSERT_TRUE(blob.has_value());

    auto plaintext = cipher.decrypt(blob->body(), "pw");
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(to_text(*plaintext), "api-key");
}

TEST_F(CredentialCipherTest, EmptyPlaintext) {
    auto blob = cipher.encrypt("", "pw");
    ASSERT_TRUE(blob.has_value());
    EXPECT_TRUE(blob->ciphertext.empty());

    auto plaintext = cipher.decrypt(blob->serialize(), "pw");
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_TRUE(plaintext->empty());
}

TEST_F(CredentialCipherTest, FreshSaltAndIvEveryCall) {
    auto a = cipher.encrypt("same", "pw");
    auto b = cipher.encrypt("same", "pw");
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_NE(a->salt, b->salt);
    EXPECT_NE(a->iv, b->iv);
    EXPECT_NE(a->serialize(), b->serialize());
}

// ============================================================================
// Failure modes share one error
// ============================================================================

TEST_F(CredentialCipherTest, WrongPassphraseFails) {
    auto blob = cipher.encrypt("secret", "right");
    ASSERT_TRUE(blob.has_value());

    auto result = cipher.decrypt(*blob, "wrong");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), AuthError::DecryptionFailed);
}

TEST_F(CredentialCipherTest, AnyTamperedByteFails) {
    auto blob = cipher.encrypt("secret value", "pw");
    ASSERT_TRUE(blob.has_value());

    auto flip = [this](EncryptedBlob tampered) {
        auto result = cipher.decrypt(tampered, "pw");
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error(), AuthError::DecryptionFailed);
    };

    EncryptedBlob ciphertext = *blob;
    ciphertext.ciphertext[0] ^= 0x01;
    flip(ciphertext);

    EncryptedBlob tag = *blob;
    tag.tag.back() ^= 0x80;
    flip(tag);

    EncryptedBlob iv = *blob;
    iv.iv[0] ^= 0x01;
    flip(iv);

    EncryptedBlob salt = *blob;
    salt.salt[5] ^= 0x01;
    flip(salt);
}

TEST_F(CredentialCipherTest, MalformedInputFails) {
    EXPECT_EQ(cipher.decrypt(std::string_view("not base64!"), "pw").error(), AuthError::DecryptionFailed);
    EXPECT_EQ(cipher.decrypt(std::string_view("AAAA"), "pw").error(), AuthError::DecryptionFailed);
    EXPECT_EQ(cipher.decrypt(std::string_view("scrypt:n=1$AAAA"), "pw").error(), AuthError::DecryptionFailed);

    auto blob = cipher.encrypt("x", "pw");
    ASSERT_TRUE(blob.has_value());
    EncryptedBlob truncated = *blob;
    truncated.tag.pop_back();
    EXPECT_EQ(cipher.decrypt(truncated, "pw").error(), AuthError::DecryptionFailed);
}

// ============================================================================
// Descriptor
// ============================================================================

TEST(EncryptedBlobTest, DescriptorRoundTrip) {
    KdfParameters params;
    params.algorithm = KdfAlgorithm::PBKDF2_HMAC_SHA256;
    params.pbkdf2_iterations = 250000;

    EncryptedBlob blob;
    blob.kdf = params;
    blob.iv_length = 16;
    EXPECT_EQ(blob.descriptor(), "pbkdf2-sha256:i=250000,iv=16");

    auto parsed = EncryptedBlob::parse_descriptor(blob.descriptor(), KdfParameters{});
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->first.algorithm, KdfAlgorithm::PBKDF2_HMAC_SHA256);
    EXPECT_EQ(parsed->first.pbkdf2_iterations, 250000u);
    EXPECT_EQ(parsed->second, 16u);
}

TEST(EncryptedBlobTest, DescriptorRejectsOutOfRangeValues) {
    const KdfParameters defaults;
    EXPECT_FALSE(EncryptedBlob::parse_descriptor("argon2id:m=30,t=3,p=1,iv=12", defaults));
    EXPECT_FALSE(EncryptedBlob::parse_descriptor("argon2id:m=16,t=3,p=1,iv=8", defaults));
    EXPECT_FALSE(EncryptedBlob::parse_descriptor("argon2id:m=16,t=3,p=1", defaults));
    EXPECT_FALSE(EncryptedBlob::parse_descriptor("pbkdf2-sha256:i=-1,iv=12", defaults));
    EXPECT_FALSE(EncryptedBlob::parse_descriptor("argon2id", defaults));
    EXPECT_TRUE(EncryptedBlob::parse_descriptor("argon2id:m=16,t=3,p=1,iv=12", defaults));
}

// ============================================================================
// Passphrase hashing and backups
// ============================================================================

TEST_F(CredentialCipherTest, HashAndVerifyPassphrase) {
    auto hash = cipher.hash_passphrase("operator secret");
    ASSERT_TRUE(hash.has_value());
    EXPECT_TRUE(hash->starts_with("$argon2id$"));
    EXPECT_TRUE(cipher.verify_passphrase("operator secret", *hash));
    EXPECT_FALSE(cipher.verify_passphrase("operator secreT", *hash));
    EXPECT_FALSE(cipher.verify_passphrase("operator secret", "not-a-hash"));
}

TEST_F(CredentialCipherTest, CredentialBackupRoundTrip) {
    const std::map<std::string, std::string> credentials{
        {"smtp", "mail-password"},
        {"sms-gateway", "token-abc"},
        {"empty", ""},
    };

    auto backup = cipher.create_credential_backup(credentials, "backup pw");
    ASSERT_TRUE(backup.has_value());
    EXPECT_EQ(backup->find("mail-password"), std::string::npos);

    auto restored = cipher.restore_credential_backup(*backup, "backup pw");
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, credentials);

    auto wrong = cipher.restore_credential_backup(*backup, "other pw");
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error(), AuthError::DecryptionFailed);
}

TEST_F(CredentialCipherTest, NonBackupPayloadIsRejected) {
    // Valid ciphertext of something that is not a credential set
    auto blob = cipher.encrypt(std::string_view("\xff\xff\xff", 3), "pw");
    ASSERT_TRUE(blob.has_value());
    auto restored = cipher.restore_credential_backup(blob->serialize(), "pw");
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error(), AuthError::DecryptionFailed);
}

TEST_F(CredentialCipherTest, Pbkdf2CipherReadsArgon2Data) {
    auto blob = cipher.encrypt("portable", "pw");
    ASSERT_TRUE(blob.has_value());

    KdfBackendProvider fips_like{KdfBackendOptions{KdfBackendPreference::Pbkdf2, false}};
    CredentialCipher pbkdf2_cipher{&fips_like, &pool, fast_kdf_parameters()};

    auto plaintext = pbkdf2_cipher.decrypt(blob->serialize(), "pw");
    ASSERT_TRUE(plaintext.has_value());
    EXPECT_EQ(to_text(*plaintext), "portable");

    auto fresh = pbkdf2_cipher.encrypt("new", "pw");
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh->kdf.algorithm, KdfAlgorithm::PBKDF2_HMAC_SHA256);
    EXPECT_TRUE(fresh->serialize().starts_with("pbkdf2-sha256:i=100000,iv=12$"));
}

TEST(CredentialCipherConstruction, NullCollaboratorsThrow) {
    KdfBackendProvider provider{KdfBackendOptions{}};
    KdfWorkerPool pool{KdfWorkerPool::Options{}};
    EXPECT_THROW(CredentialCipher(nullptr, &pool, KdfParameters{}), std::invalid_argument);
    EXPECT_THROW(CredentialCipher(&provider, nullptr, KdfParameters{}), std::invalid_argument);
}
