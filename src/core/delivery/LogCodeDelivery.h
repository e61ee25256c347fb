// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#pragma once

#include "ICodeDelivery.h"

namespace AuthKeep {

/**
 * @brief Development delivery: writes the code to the log
 *
 * With production set the code is never logged; only the hashed
 * identifier and expiry are, so a misconfigured deployment cannot leak
 * codes through its logs.
 */
class LogCodeDelivery final : public ICodeDelivery {
public:
    explicit LogCodeDelivery(bool production) noexcept : m_production(production) {}

    [[nodiscard]] AuthResult<void> deliver(const CodeMessage& message) override;

private:
    bool m_production;
};

} // namespace AuthKeep
