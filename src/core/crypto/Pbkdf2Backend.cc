// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "Pbkdf2Backend.h"
#include "SecureRandom.h"
#include "../../utils/Encoding.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <array>
#include <charconv>
#include <format>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace AuthKeep {

namespace {
constexpr std::string_view HASH_PREFIX{"$pbkdf2-sha256$i="};
}

uint32_t Pbkdf2Backend::effective_iterations(const KdfParameters& params) noexcept {
    return std::clamp(params.pbkdf2_iterations, KdfParameters::MIN_PBKDF2_ITERATIONS, MAX_ITERATIONS);
}

AuthResult<SecureVector<uint8_t>> Pbkdf2Backend::pbkdf2(
    std::string_view passphrase,
    std::span<const uint8_t> salt,
    uint32_t iterations) noexcept {

    SecureVector<uint8_t> key(KEY_LENGTH);

    int result = PKCS5_PBKDF2_HMAC(
        passphrase.data(), static_cast<int>(passphrase.size()),
        salt.data(), static_cast<int>(salt.size()),
        static_cast<int>(iterations),
        EVP_sha256(),
        static_cast<int>(KEY_LENGTH),
        key.data()
    );

    if (result != 1) {
        Log::error("Pbkdf2Backend: PBKDF2 failed");
        return std::unexpected(AuthError::InternalError);
    }
    return key;
}

AuthResult<SecureVector<uint8_t>> Pbkdf2Backend::derive_key(
    std::string_view passphrase,
    std::span<const uint8_t> salt,
    const KdfParameters& params) const noexcept {

    if (salt.size() < MIN_SALT_LENGTH) {
        Log::error("Pbkdf2Backend: Salt too short ({} bytes, minimum {})",
                   salt.size(), MIN_SALT_LENGTH);
        return std::unexpected(AuthError::ValidationError);
    }

    const uint32_t iterations = effective_iterations(params);
    if (iterations != params.pbkdf2_iterations) {
        Log::warning("Pbkdf2Backend: iteration count {} adjusted to {}",
                     params.pbkdf2_iterations, iterations);
    }

    auto key = pbkdf2(passphrase, salt, iterations);
    if (key) {
        Log::debug("Pbkdf2Backend: key derived ({} iterations)", iterations);
    }
    return key;
}

AuthResult<std::string> Pbkdf2Backend::hash_passphrase(
    std::string_view passphrase,
    const KdfParameters& params) const noexcept {

    std::array<uint8_t, HASH_SALT_LENGTH> salt{};
    if (!SecureRandom::fill(salt)) {
        Log::error("Pbkdf2Backend: CSPRNG failure while generating salt");
        return std::unexpected(AuthError::InternalError);
    }

    const uint32_t iterations = effective_iterations(params);
    auto hash = pbkdf2(passphrase, salt, iterations);
    if (!hash) {
        return std::unexpected(hash.error());
    }

    return std::format("{}{}${}${}", HASH_PREFIX, iterations,
                       Encoding::to_base64(salt),
                       Encoding::to_base64(std::span<const uint8_t>(hash->data(), hash->size())));
}

bool Pbkdf2Backend::verify_passphrase(
    std::string_view passphrase,
    std::string_view encoded_hash) const noexcept {

    if (!recognizes(encoded_hash)) {
        return false;
    }

    // i=<n>$<salt>$<hash>
    std::string_view rest = encoded_hash.substr(HASH_PREFIX.size());
    const size_t first_sep = rest.find('$');
    if (first_sep == std::string_view::npos) {
        return false;
    }
    const size_t second_sep = rest.find('$', first_sep + 1);
    if (second_sep == std::string_view::npos) {
        return false;
    }

    uint32_t iterations = 0;
    const auto iter_text = rest.substr(0, first_sep);
    auto [ptr, ec] = std::from_chars(iter_text.data(), iter_text.data() + iter_text.size(), iterations);
    if (ec != std::errc{} || ptr != iter_text.data() + iter_text.size() ||
        iterations < KdfParameters::MIN_PBKDF2_ITERATIONS || iterations > MAX_ITERATIONS) {
        return false;
    }

    auto salt = Encoding::from_base64(rest.substr(first_sep + 1, second_sep - first_sep - 1));
    auto expected = Encoding::from_base64(rest.substr(second_sep + 1));
    if (!salt || !expected || salt->size() < MIN_SALT_LENGTH || expected->size() != KEY_LENGTH) {
        return false;
    }

    auto actual = pbkdf2(passphrase, *salt, iterations);
    if (!actual) {
        return false;
    }

    return CRYPTO_memcmp(actual->data(), expected->data(), KEY_LENGTH) == 0;
}

bool Pbkdf2Backend::recognizes(std::string_view encoded_hash) const noexcept {
    return encoded_hash.starts_with(HASH_PREFIX);
}

} // namespace AuthKeep
