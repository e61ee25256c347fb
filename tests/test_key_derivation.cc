// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "../src/core/crypto/Argon2idBackend.h"
#include "../src/core/crypto/KdfBackendProvider.h"
#include "../src/core/crypto/Pbkdf2Backend.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <array>
#include <thread>
#include <vector>

using namespace AuthKeep;
using namespace AuthKeep::Testing;

namespace {

constexpr std::array<uint8_t, 16> SALT{
    0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
    0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};

constexpr std::array<uint8_t, 16> OTHER_SALT{
    0xff, 0xee, 0xdd, 0xcc, 0xbb, 0xaa, 0x99, 0x88,
    0x77, 0x66, 0x55, 0x44, 0x33, 0x22, 0x11, 0x00};

} // namespace

// ============================================================================
// Argon2id
// ============================================================================

TEST(Argon2idBackendTest, DerivationIsDeterministic) {
    Argon2idBackend backend;
    const auto params = fast_kdf_parameters().with_algorithm(KdfAlgorithm::ARGON2ID);

    auto first = backend.derive_key("correct horse", SALT, params);
    auto second = backend.derive_key("correct horse", SALT, params);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->size(), IKeyDerivationBackend::KEY_LENGTH);
    EXPECT_EQ(*first, *second);

    EXPECT_NE(*first, *backend.derive_key("correct horsf", SALT, params));
    EXPECT_NE(*first, *backend.derive_key("correct horse", OTHER_SALT, params));

    auto costlier = params;
    costlier.argon2_time_cost = 3;
    EXPECT_NE(*first, *backend.derive_key("correct horse", SALT, costlier));
}

TEST(Argon2idBackendTest, RejectsShortSaltAndBadParameters) {
    Argon2idBackend backend;
    const auto params = fast_kdf_parameters().with_algorithm(KdfAlgorithm::ARGON2ID);

    const std::array<uint8_t, 8> short_salt{};
    EXPECT_EQ(backend.derive_key("pw", short_salt, params).error(), AuthError::ValidationError);

    auto too_big = params;
    too_big.argon2_memory_cost_log2 = Argon2idBackend::MAX_MEMORY_COST_LOG2 + 1;
    EXPECT_EQ(backend.derive_key("pw", SALT, too_big).error(), AuthError::ConfigurationError);

    auto zero_time = params;
    zero_time.argon2_time_cost = 0;
    EXPECT_EQ(backend.derive_key("pw", SALT, zero_time).error(), AuthError::ConfigurationError);

    auto lanes = params;
    lanes.argon2_parallelism = 4;
    EXPECT_EQ(backend.derive_key("pw", SALT, lanes).error(), AuthError::ConfigurationError);
}

TEST(Argon2idBackendTest, HashAndVerify) {
    Argon2idBackend backend;
    const auto params = fast_kdf_parameters().with_algorithm(KdfAlgorithm::ARGON2ID);

    auto hash = backend.hash_passphrase("operator passphrase", params);
    ASSERT_TRUE(hash.has_value());
    EXPECT_TRUE(backend.recognizes(*hash));
    EXPECT_EQ(hash->find('\0'), std::string::npos);

    EXPECT_TRUE(backend.verify_passphrase("operator passphrase", *hash));
    EXPECT_FALSE(backend.verify_passphrase("operator passphrasf", *hash));
    EXPECT_FALSE(backend.verify_passphrase("operator passphrase", "$argon2id$garbage"));

    // Salted: two hashes of the same passphrase differ
    EXPECT_NE(*hash, *backend.hash_passphrase("operator passphrase", params));
}

TEST(Argon2idBackendTest, SelfTestPasses) {
    Argon2idBackend backend;
    EXPECT_TRUE(backend.self_test());
}

// ============================================================================
// PBKDF2
// ============================================================================

TEST(Pbkdf2BackendTest, DerivationIsDeterministic) {
    Pbkdf2Backend backend;
    const auto params = fast_kdf_parameters().with_algorithm(KdfAlgorithm::PBKDF2_HMAC_SHA256);

    auto first = backend.derive_key("correct horse", SALT, params);
    auto second = backend.derive_key("correct horse", SALT, params);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->size(), IKeyDerivationBackend::KEY_LENGTH);
    EXPECT_EQ(*first, *second);
    EXPECT_NE(*first, *backend.derive_key("correct horse", OTHER_SALT, params));
}

TEST(Pbkdf2BackendTest, IterationsAreClampedToFloor) {
    KdfParameters params;
    params.pbkdf2_iterations = 1000;
    EXPECT_EQ(Pbkdf2Backend::effective_iterations(params), KdfParameters::MIN_PBKDF2_ITERATIONS);

    params.pbkdf2_iterations = Pbkdf2Backend::MAX_ITERATIONS + 1;
    EXPECT_EQ(Pbkdf2Backend::effective_iterations(params), Pbkdf2Backend::MAX_ITERATIONS);

    params.pbkdf2_iterations = 600000;
    EXPECT_EQ(Pbkdf2Backend::effective_iterations(params), 600000u);

    // A weak request derives the same key as the floor
    Pbkdf2Backend backend;
    KdfParameters weak = fast_kdf_parameters().with_algorithm(KdfAlgorithm::PBKDF2_HMAC_SHA256);
    weak.pbkdf2_iterations = 1;
    EXPECT_EQ(*backend.derive_key("pw", SALT, weak),
              *backend.derive_key("pw", SALT, fast_kdf_parameters()
                                                 .with_algorithm(KdfAlgorithm::PBKDF2_HMAC_SHA256)));
}

TEST(Pbkdf2BackendTest, HashAndVerify) {
    Pbkdf2Backend backend;
    const auto params = fast_kdf_parameters().with_algorithm(KdfAlgorithm::PBKDF2_HMAC_SHA256);

    auto hash = backend.hash_passphrase("operator passphrase", params);
    ASSERT_TRUE(hash.has_value());
    EXPECT_TRUE(hash->starts_with("$pbkdf2-sha256$i=100000$"));
    EXPECT_TRUE(backend.recognizes(*hash));
    EXPECT_TRUE(backend.verify_passphrase("operator passphrase", *hash));
    EXPECT_FALSE(backend.verify_passphrase("wrong", *hash));
}

TEST(Pbkdf2BackendTest, MalformedHashesNeverVerify) {
    Pbkdf2Backend backend;
    EXPECT_FALSE(backend.verify_passphrase("pw", ""));
    EXPECT_FALSE(backend.verify_passphrase("pw", "$pbkdf2-sha256$i=100000"));
    EXPECT_FALSE(backend.verify_passphrase("pw", "$pbkdf2-sha256$i=10$AAAA$AAAA"));
    EXPECT_FALSE(backend.verify_passphrase("pw", "$pbkdf2-sha256$i=abc$AAAA$AAAA"));
    EXPECT_FALSE(backend.verify_passphrase("pw", "$pbkdf2-sha256$i=100000$!!$AAAA"));
}

// ============================================================================
// Backend provider
// ============================================================================

TEST(KdfBackendProviderTest, AutoPrefersArgon2id) {
    KdfBackendProvider provider({KdfBackendPreference::Auto, false});
    auto preferred = provider.preferred();
    ASSERT_TRUE(preferred.has_value());
    EXPECT_TRUE(provider.argon2_available());
    EXPECT_EQ((*preferred)->algorithm(), KdfAlgorithm::ARGON2ID);
    EXPECT_FALSE(provider.fips_enabled());
}

TEST(KdfBackendProviderTest, Pbkdf2PreferenceIsHonoured) {
    KdfBackendProvider provider({KdfBackendPreference::Pbkdf2, false});
    auto preferred = provider.preferred();
    ASSERT_TRUE(preferred.has_value());
    EXPECT_EQ((*preferred)->algorithm(), KdfAlgorithm::PBKDF2_HMAC_SHA256);

    // Existing Argon2id data stays readable
    auto argon2 = provider.for_algorithm(KdfAlgorithm::ARGON2ID);
    ASSERT_TRUE(argon2.has_value());
    EXPECT_EQ((*argon2)->algorithm(), KdfAlgorithm::ARGON2ID);
}

TEST(KdfBackendProviderTest, SelectsBackendFromEncodedHash) {
    KdfBackendProvider provider({KdfBackendPreference::Auto, false});

    auto argon2 = provider.for_encoded_hash("$argon2id$v=19$m=4096,t=2,p=1$c2FsdA$aGFzaA");
    ASSERT_TRUE(argon2.has_value());
    EXPECT_EQ((*argon2)->algorithm(), KdfAlgorithm::ARGON2ID);

    auto pbkdf2 = provider.for_encoded_hash("$pbkdf2-sha256$i=100000$AAAA$AAAA");
    ASSERT_TRUE(pbkdf2.has_value());
    EXPECT_EQ((*pbkdf2)->algorithm(), KdfAlgorithm::PBKDF2_HMAC_SHA256);

    auto unknown = provider.for_encoded_hash("$2b$10$bcrypt");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), AuthError::ValidationError);
}

TEST(KdfBackendProviderTest, InitializesExactlyOnceUnderContention) {
    KdfBackendProvider provider({KdfBackendPreference::Auto, false});

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&provider] {
            auto preferred = provider.preferred();
            EXPECT_TRUE(preferred.has_value());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(provider.initialization_count(), 1);
    EXPECT_TRUE(provider.preferred().has_value());
    EXPECT_EQ(provider.initialization_count(), 1);
}
