// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IdentifierHashService.cc
 * @brief Implementation of identifier and code hashing
 */

#include "IdentifierHashService.h"
#include "../../utils/Encoding.h"
#include "../../utils/SecureMemory.h"
#include "../../utils/StringHelpers.h"
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace AuthKeep {

// ============================================================================
// Digests
// ============================================================================

AuthResult<IdentifierHashService::Digest>
IdentifierHashService::sha256(std::span<const uint8_t> data) noexcept {
    EVPDigestContextPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return std::unexpected(AuthError::InternalError);
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::unexpected(AuthError::InternalError);
    }

    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return std::unexpected(AuthError::InternalError);
    }

    Digest digest{};
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1 ||
        digest_len != DIGEST_LENGTH) {
        return std::unexpected(AuthError::InternalError);
    }

    return digest;
}

AuthResult<std::string> IdentifierHashService::sha256_hex(std::string_view data) noexcept {
    auto digest = sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(data.data()), data.size()));
    if (!digest) {
        return std::unexpected(digest.error());
    }
    return Encoding::to_hex(*digest);
}

AuthResult<std::string> IdentifierHashService::hash_identifier(std::string_view identifier) noexcept {
    auto normalized = normalize_identifier(identifier);
    if (!normalized) {
        return std::unexpected(AuthError::ValidationError);
    }
    auto hashed = sha256_hex(*normalized);
    secure_clear_string(*normalized);
    return hashed;
}

// ============================================================================
// One-time codes
// ============================================================================

AuthResult<std::string> IdentifierHashService::hash_code(
    std::string_view code,
    std::string_view salt_hex) noexcept {

    if (code.empty() || salt_hex.empty()) {
        return std::unexpected(AuthError::ValidationError);
    }

    std::string input;
    input.reserve(code.size() + salt_hex.size() + CODE_DOMAIN_TAG.size());
    input.append(code);
    input.append(salt_hex);
    input.append(CODE_DOMAIN_TAG);

    auto hashed = sha256_hex(input);
    secure_clear_string(input);
    return hashed;
}

bool IdentifierHashService::verify_code(
    std::string_view code,
    std::string_view salt_hex,
    std::string_view stored_hash_hex) noexcept {

    auto computed = hash_code(code, salt_hex);
    if (!computed) {
        return false;
    }
    return constant_time_compare(*computed, stored_hash_hex);
}

// ============================================================================
// Comparison
// ============================================================================

bool IdentifierHashService::constant_time_compare(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) noexcept {

    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    // CRYPTO_memcmp is constant-time (timing-attack resistant)
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool IdentifierHashService::constant_time_compare(
    std::string_view a,
    std::string_view b) noexcept {

    return constant_time_compare(
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(a.data()), a.size()),
        std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(b.data()), b.size()));
}

} // namespace AuthKeep
