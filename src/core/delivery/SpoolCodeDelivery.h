// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SpoolCodeDelivery.h
 * @brief Hands codes to an external mailer through a spool directory
 *
 * Each code becomes one file "<random>.msg" written with StoreIO (mode
 * 0600, atomic rename), so the mailer never sees a partial message. The
 * spool directory is created with mode 0700 if missing.
 *
 * File layout:
 * @code
 * To: <identifier>
 * Subject: Your AuthKeep sign-in code
 *
 * <body>
 * @endcode
 */

#pragma once

#include "ICodeDelivery.h"
#include <filesystem>
#include <string>

namespace AuthKeep {

class SpoolCodeDelivery final : public ICodeDelivery {
public:
    static constexpr size_t FILE_ID_BYTES = 16;

    explicit SpoolCodeDelivery(std::filesystem::path spool_dir);

    [[nodiscard]] AuthResult<void> deliver(const CodeMessage& message) override;

    /** @brief Message text for one code */
    [[nodiscard]] static std::string format_message(const CodeMessage& message);

    [[nodiscard]] const std::filesystem::path& spool_dir() const noexcept { return m_spool_dir; }

private:
    std::filesystem::path m_spool_dir;
};

} // namespace AuthKeep
