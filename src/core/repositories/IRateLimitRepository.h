// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file IRateLimitRepository.h
 * @brief Interface for fixed-window rate-limit counters
 */

#pragma once

#include "RepositoryError.h"
#include "auth_records.pb.h"
#include <cstdint>
#include <string_view>

namespace AuthKeep {

/**
 * @brief Interface for rate-limit counter storage
 *
 * @note Implementations must be thread-safe; increment_counter() must not
 *       lose updates under concurrent calls on one key
 */
class IRateLimitRepository {
public:
    virtual ~IRateLimitRepository() = default;

    /**
     * @brief Atomically count one request against a key
     *
     * If no counter exists or now >= reset_at, a new window starts with
     * window_start = now, count = 1, reset_at = now + window_ms.
     * Otherwise count is incremented.
     *
     * @return Counter state after the increment
     */
    [[nodiscard]] virtual RepositoryResult<authkeep::RateLimitCounter> increment_counter(
        std::string_view key,
        int64_t window_ms,
        int64_t now_ms) = 0;

    /**
     * @brief Delete counters whose window has elapsed
     */
    [[nodiscard]] virtual RepositoryResult<size_t> delete_expired_counters(int64_t now_ms) = 0;
};

} // namespace AuthKeep
