// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file StringHelpers.h
 * @brief Request string validation utilities
 */

#ifndef AUTHKEEP_STRING_HELPERS_H
#define AUTHKEEP_STRING_HELPERS_H

#include <glibmm/ustring.h>
#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include "Log.h"

namespace AuthKeep {

/// Longest identifier accepted (RFC 5321 path limit for email addresses)
inline constexpr size_t MAX_IDENTIFIER_BYTES = 320;

/**
 * @brief Validate and trim a delivery identifier (email, npub, phone)
 *
 * Rejects invalid UTF-8 and embedded control characters. Leading and
 * trailing whitespace is removed; case is preserved because npub and
 * NIP-05 identifiers are case-sensitive.
 *
 * @param raw Identifier as received
 * @return Normalized identifier, or std::nullopt if unusable
 */
inline std::optional<std::string> normalize_identifier(std::string_view raw) {
    const Glib::ustring ustr{std::string(raw)};
    if (!ustr.validate()) {
        Log::warning("Invalid UTF-8 detected in identifier - rejecting");
        return std::nullopt;
    }

    const auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    };
    auto begin = std::find_if_not(raw.begin(), raw.end(), is_space);
    auto end = std::find_if_not(raw.rbegin(), std::make_reverse_iterator(begin), is_space).base();
    std::string trimmed(begin, end);

    if (trimmed.empty() || trimmed.size() > MAX_IDENTIFIER_BYTES) {
        return std::nullopt;
    }
    if (std::any_of(trimmed.begin(), trimmed.end(),
                    [](char c) { return static_cast<unsigned char>(c) < 0x20 || c == 0x7f; })) {
        return std::nullopt;
    }
    return trimmed;
}

/**
 * @brief Whether a supplied one-time code has the expected shape
 * @return true for exactly six ASCII digits
 */
[[nodiscard]] constexpr bool is_otp_code_format(std::string_view code) noexcept {
    if (code.size() != 6) {
        return false;
    }
    return std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace AuthKeep

#endif // AUTHKEEP_STRING_HELPERS_H
