// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file SecureRandom.h
 * @brief CSPRNG helpers for salts, IVs, session ids, challenges and codes
 *
 * All randomness comes from OpenSSL RAND_bytes. A CSPRNG failure is a
 * security event: the throwing helpers raise std::runtime_error and never
 * return predictable data.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace AuthKeep {

class SecureRandom final {
public:
    SecureRandom() = delete;

    /**
     * @brief Fill a caller-owned buffer
     * @return false if the CSPRNG failed (buffer is wiped)
     */
    [[nodiscard]] static bool fill(std::span<uint8_t> out) noexcept;

    /**
     * @brief Generate cryptographically secure random bytes
     * @throws std::runtime_error on CSPRNG failure
     */
    [[nodiscard]] static std::vector<uint8_t> generate_random_bytes(size_t length);

    /**
     * @brief Random bytes, hex encoded (2 * byte_count characters)
     * @throws std::runtime_error on CSPRNG failure
     */
    [[nodiscard]] static std::string random_hex(size_t byte_count);

    /**
     * @brief Uniform integer in [low, high] (inclusive)
     *
     * Rejection sampling over 32-bit draws, so no value is favoured by a
     * modulo bias.
     *
     * @throws std::runtime_error on CSPRNG failure
     * @throws std::invalid_argument if low > high
     */
    [[nodiscard]] static uint32_t uniform(uint32_t low, uint32_t high);

    /**
     * @brief Six-digit one-time code, uniform in [100000, 999999]
     * @throws std::runtime_error on CSPRNG failure
     */
    [[nodiscard]] static std::string otp_code();
};

} // namespace AuthKeep
