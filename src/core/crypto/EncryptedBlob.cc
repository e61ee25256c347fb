// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "EncryptedBlob.h"
#include "Argon2idBackend.h"
#include "Pbkdf2Backend.h"
#include "../../utils/Encoding.h"
#include <charconv>
#include <format>

namespace AuthKeep {

namespace {

// Parses "key=value" with an unsigned value; returns false on any deviation
bool parse_field(std::string_view field, std::string_view key, uint32_t& out) {
    if (!field.starts_with(key) || field.size() <= key.size() + 1 || field[key.size()] != '=') {
        return false;
    }
    const auto value = field.substr(key.size() + 1);
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    return ec == std::errc{} && ptr == value.data() + value.size();
}

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    for (;;) {
        const size_t pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

}  // namespace

std::string EncryptedBlob::body() const {
    std::vector<uint8_t> raw;
    raw.reserve(salt.size() + iv.size() + tag.size() + ciphertext.size());
    raw.insert(raw.end(), salt.begin(), salt.end());
    raw.insert(raw.end(), iv.begin(), iv.end());
    raw.insert(raw.end(), tag.begin(), tag.end());
    raw.insert(raw.end(), ciphertext.begin(), ciphertext.end());
    return Encoding::to_base64(raw);
}

std::string EncryptedBlob::descriptor() const {
    switch (kdf.algorithm) {
        case KdfAlgorithm::ARGON2ID:
            return std::format("argon2id:m={},t={},p={},iv={}",
                               kdf.argon2_memory_cost_log2, kdf.argon2_time_cost,
                               kdf.argon2_parallelism, iv_length);
        case KdfAlgorithm::PBKDF2_HMAC_SHA256:
            return std::format("pbkdf2-sha256:i={},iv={}",
                               Pbkdf2Backend::effective_iterations(kdf), iv_length);
    }
    return {};
}

std::string EncryptedBlob::serialize() const {
    return descriptor() + "$" + body();
}

std::optional<std::pair<KdfParameters, size_t>> EncryptedBlob::parse_descriptor(
    std::string_view descriptor, const KdfParameters& defaults) {

    const size_t colon = descriptor.find(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    const auto name = descriptor.substr(0, colon);
    const auto fields = split(descriptor.substr(colon + 1), ',');

    KdfParameters params = defaults;
    uint32_t iv_len = 0;

    if (name == "argon2id") {
        if (fields.size() != 4 ||
            !parse_field(fields[0], "m", params.argon2_memory_cost_log2) ||
            !parse_field(fields[1], "t", params.argon2_time_cost) ||
            !parse_field(fields[2], "p", params.argon2_parallelism) ||
            !parse_field(fields[3], "iv", iv_len)) {
            return std::nullopt;
        }
        if (params.argon2_memory_cost_log2 < Argon2idBackend::MIN_MEMORY_COST_LOG2 ||
            params.argon2_memory_cost_log2 > Argon2idBackend::MAX_MEMORY_COST_LOG2) {
            return std::nullopt;
        }
        params.algorithm = KdfAlgorithm::ARGON2ID;
    } else if (name == "pbkdf2-sha256") {
        if (fields.size() != 2 ||
            !parse_field(fields[0], "i", params.pbkdf2_iterations) ||
            !parse_field(fields[1], "iv", iv_len)) {
            return std::nullopt;
        }
        params.algorithm = KdfAlgorithm::PBKDF2_HMAC_SHA256;
    } else {
        return std::nullopt;
    }

    if (iv_len < MIN_IV_LENGTH || iv_len > MAX_IV_LENGTH) {
        return std::nullopt;
    }
    return std::make_pair(params, static_cast<size_t>(iv_len));
}

std::optional<EncryptedBlob> EncryptedBlob::parse(
    std::string_view text, const KdfParameters& defaults) {

    EncryptedBlob blob;
    blob.kdf = defaults;
    blob.iv_length = DEFAULT_IV_LENGTH;

    std::string_view body_text = text;
    if (const size_t sep = text.rfind('$'); sep != std::string_view::npos) {
        auto parsed = parse_descriptor(text.substr(0, sep), defaults);
        if (!parsed) {
            return std::nullopt;
        }
        blob.kdf = parsed->first;
        blob.iv_length = parsed->second;
        body_text = text.substr(sep + 1);
    }

    auto raw = Encoding::from_base64(body_text);
    const size_t header = SALT_LENGTH + blob.iv_length + TAG_LENGTH;
    if (!raw || raw->size() < header) {
        return std::nullopt;
    }

    auto it = raw->begin();
    blob.salt.assign(it, it + SALT_LENGTH);
    it += SALT_LENGTH;
    blob.iv.assign(it, it + static_cast<std::ptrdiff_t>(blob.iv_length));
    it += static_cast<std::ptrdiff_t>(blob.iv_length);
    blob.tag.assign(it, it + TAG_LENGTH);
    it += TAG_LENGTH;
    blob.ciphertext.assign(it, raw->end());
    return blob;
}

} // namespace AuthKeep
