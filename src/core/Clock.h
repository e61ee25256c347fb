// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file Clock.h
 * @brief Injectable time source
 *
 * Services never call system_clock directly so that expiry windows and
 * rate-limit resets can be driven deterministically from tests.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace AuthKeep {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Abstract wall clock
 */
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual TimePoint now() const noexcept = 0;
};

/**
 * @brief Production clock backed by std::chrono::system_clock
 */
class SystemClock final : public IClock {
public:
    [[nodiscard]] TimePoint now() const noexcept override {
        return std::chrono::system_clock::now();
    }
};

/** @brief Milliseconds since the Unix epoch, the unit stored in records */
[[nodiscard]] inline int64_t to_epoch_ms(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}

[[nodiscard]] inline TimePoint from_epoch_ms(int64_t ms) noexcept {
    return TimePoint{std::chrono::milliseconds{ms}};
}

} // namespace AuthKeep
