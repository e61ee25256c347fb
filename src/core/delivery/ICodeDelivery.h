// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file ICodeDelivery.h
 * @brief Channel that carries a one-time code to its recipient
 *
 * The transport (email, Nostr DM, SMS) lives outside the core. A failed
 * delivery never invalidates the session; the code stays verifiable until
 * it expires.
 */

#pragma once

#include "../AuthError.h"
#include "../Clock.h"
#include <chrono>
#include <string_view>

namespace AuthKeep {

/**
 * @brief One code to deliver
 *
 * identifier is the raw destination, needed by the transport. It and the
 * code are borrowed for the duration of deliver() and must not be kept.
 */
struct CodeMessage {
    std::string_view identifier;
    std::string_view hashed_identifier;
    std::string_view code;
    TimePoint expires_at;
    std::chrono::minutes ttl;
};

class ICodeDelivery {
public:
    virtual ~ICodeDelivery() = default;

    /**
     * @brief Hand a code to the channel
     * @return InternalError if the channel refused or failed
     */
    [[nodiscard]] virtual AuthResult<void> deliver(const CodeMessage& message) = 0;
};

} // namespace AuthKeep
