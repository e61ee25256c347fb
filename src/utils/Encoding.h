// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Encoding.h
 * @brief Hex and base64 codecs for hashes, ids and encrypted blobs
 *
 * Base64 uses OpenSSL's EVP_EncodeBlock/EVP_DecodeBlock (standard alphabet,
 * padded, no line breaks).
 */

#ifndef AUTHKEEP_ENCODING_H
#define AUTHKEEP_ENCODING_H

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <openssl/evp.h>

namespace AuthKeep::Encoding {

/**
 * @brief Lowercase hex encoding
 */
[[nodiscard]] inline std::string to_hex(std::span<const uint8_t> data) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

/**
 * @brief Decode hex (either case)
 * @return Bytes, or std::nullopt on odd length or a non-hex character
 */
[[nodiscard]] inline std::optional<std::vector<uint8_t>> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = nibble(hex[i]);
        const int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

/**
 * @brief Standard padded base64
 */
[[nodiscard]] inline std::string to_base64(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

/**
 * @brief Decode standard padded base64
 *
 * The input must consist of base64 alphabet characters followed by at most
 * two '=' padding characters. EVP_DecodeBlock is lenient about padding and
 * does not strip the zero bytes it produces, so both are handled here.
 *
 * @return Bytes, or std::nullopt if the input is not well-formed base64
 */
[[nodiscard]] inline std::optional<std::vector<uint8_t>> from_base64(std::string_view b64) {
    if (b64.empty()) {
        return std::vector<uint8_t>{};
    }
    if (b64.size() % 4 != 0) {
        return std::nullopt;
    }

    const size_t data_length = std::min(b64.find('='), b64.size());
    const size_t padding = b64.size() - data_length;
    if (padding > 2 || b64.find_first_not_of('=', data_length) != std::string_view::npos) {
        return std::nullopt;
    }
    for (const char c : b64.substr(0, data_length)) {
        const bool alphabet = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                              (c >= '0' && c <= '9') || c == '+' || c == '/';
        if (!alphabet) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> out(3 * (b64.size() / 4));
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(b64.data()),
                                        static_cast<int>(b64.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

} // namespace AuthKeep::Encoding

#endif // AUTHKEEP_ENCODING_H
