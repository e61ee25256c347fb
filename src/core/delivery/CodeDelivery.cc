// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file CodeDelivery.cc
 * @brief Log and spool delivery channels
 */

#include "LogCodeDelivery.h"
#include "SpoolCodeDelivery.h"
#include "../crypto/SecureRandom.h"
#include "../io/StoreIO.h"
#include "../../utils/Log.h"
#include "../../utils/SecureMemory.h"

#include <format>
#include <system_error>
#include <vector>

namespace AuthKeep {

// ============================================================================
// LogCodeDelivery
// ============================================================================

AuthResult<void> LogCodeDelivery::deliver(const CodeMessage& message) {
    if (m_production) {
        Log::info("OTP issued for subject {} (expires in {} min)",
                  message.hashed_identifier, message.ttl.count());
    } else {
        Log::warning("DEVELOPMENT: OTP for subject {} is {} (expires in {} min)",
                     message.hashed_identifier, message.code, message.ttl.count());
    }
    return {};
}

// ============================================================================
// SpoolCodeDelivery
// ============================================================================

SpoolCodeDelivery::SpoolCodeDelivery(std::filesystem::path spool_dir)
    : m_spool_dir(std::move(spool_dir)) {
}

std::string SpoolCodeDelivery::format_message(const CodeMessage& message) {
    const auto expires = std::chrono::floor<std::chrono::seconds>(message.expires_at);
    return std::format(
        "To: {}\n"
        "Subject: Your AuthKeep sign-in code\n"
        "\n"
        "AuthKeep Authentication\n"
        "\n"
        "Your one-time code: {}\n"
        "\n"
        "This code is for: {}\n"
        "Expires: {:%Y-%m-%d %H:%M:%S} UTC\n"
        "\n"
        "SECURITY NOTICE:\n"
        "- Never share this code with anyone\n"
        "- Code expires in {} minutes\n"
        "- The code can be used once, with at most 3 attempts\n"
        "\n"
        "If you didn't request this code, please ignore this message.\n",
        message.identifier, message.code, message.identifier, expires, message.ttl.count());
}

AuthResult<void> SpoolCodeDelivery::deliver(const CodeMessage& message) {
    std::error_code ec;
    if (!std::filesystem::exists(m_spool_dir, ec)) {
        std::filesystem::create_directories(m_spool_dir, ec);
        if (ec) {
            Log::error("SpoolCodeDelivery: cannot create spool directory {}: {}",
                       m_spool_dir.string(), ec.message());
            return std::unexpected(AuthError::InternalError);
        }
        std::filesystem::permissions(m_spool_dir, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            Log::error("SpoolCodeDelivery: cannot restrict spool directory {}: {}",
                       m_spool_dir.string(), ec.message());
            return std::unexpected(AuthError::InternalError);
        }
    }

    std::string text = format_message(message);
    SecureVector<uint8_t> bytes(text.begin(), text.end());
    secure_clear_string(text);

    const auto path = m_spool_dir / (SecureRandom::random_hex(FILE_ID_BYTES) + ".msg");
    if (auto written = StoreIO::write_file(path, bytes); !written) {
        Log::error("SpoolCodeDelivery: failed to spool message for subject {}",
                   message.hashed_identifier);
        return std::unexpected(written.error());
    }

    Log::debug("SpoolCodeDelivery: spooled {} for subject {}", path.filename().string(),
               message.hashed_identifier);
    return {};
}

} // namespace AuthKeep
