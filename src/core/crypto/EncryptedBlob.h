// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file EncryptedBlob.h
 * @brief Wire format of passphrase-encrypted secrets
 *
 * Body: base64( salt[32] || iv[12..16] || tag[16] || ciphertext )
 *
 * The KDF parameters travel with the body as a short descriptor so that
 * raising the work factor later does not orphan existing blobs:
 *
 *   argon2id:m=16,t=3,p=1,iv=12$<body>
 *   pbkdf2-sha256:i=600000,iv=12$<body>
 *
 * '$' never occurs in standard base64, so the last '$' separates the two.
 * A bare body with no descriptor is read with the caller's default
 * parameters and a 12-byte IV.
 */

#pragma once

#include "KeyDerivationBackend.h"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace AuthKeep {

struct EncryptedBlob {
    static constexpr size_t SALT_LENGTH = 32;        ///< 256-bit salt
    static constexpr size_t DEFAULT_IV_LENGTH = 12;  ///< 96-bit GCM IV
    static constexpr size_t MIN_IV_LENGTH = 12;
    static constexpr size_t MAX_IV_LENGTH = 16;
    static constexpr size_t TAG_LENGTH = 16;         ///< 128-bit GCM tag

    KdfParameters kdf;
    size_t iv_length = DEFAULT_IV_LENGTH;
    std::vector<uint8_t> salt;
    std::vector<uint8_t> iv;
    std::vector<uint8_t> tag;
    std::vector<uint8_t> ciphertext;

    /** @brief base64(salt || iv || tag || ciphertext) */
    [[nodiscard]] std::string body() const;

    /** @brief "<descriptor>$<body>" */
    [[nodiscard]] std::string serialize() const;

    /** @brief e.g. "argon2id:m=16,t=3,p=1,iv=12" */
    [[nodiscard]] std::string descriptor() const;

    /**
     * @brief Parse a serialized blob (with or without descriptor)
     * @param text Serialized blob
     * @param defaults Parameters assumed for a bare body
     * @return Parsed blob, or std::nullopt for any malformed input
     */
    [[nodiscard]] static std::optional<EncryptedBlob> parse(
        std::string_view text, const KdfParameters& defaults);

    /**
     * @brief Parse a descriptor into KDF parameters and IV length
     */
    [[nodiscard]] static std::optional<std::pair<KdfParameters, size_t>> parse_descriptor(
        std::string_view descriptor, const KdfParameters& defaults);
};

} // namespace AuthKeep
