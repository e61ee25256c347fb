// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "SecureRandom.h"
#include "../../utils/Encoding.h"
#include <stdexcept>
#include <openssl/crypto.h>
#include <openssl/rand.h>

namespace AuthKeep {

bool SecureRandom::fill(std::span<uint8_t> out) noexcept {
    if (out.empty()) {
        return true;
    }
    // RAND_bytes returns 1 on success, 0 or -1 on failure
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        OPENSSL_cleanse(out.data(), out.size());
        return false;
    }
    return true;
}

std::vector<uint8_t> SecureRandom::generate_random_bytes(size_t length) {
    std::vector<uint8_t> bytes(length);
    if (!fill(bytes)) {
        throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
    }
    return bytes;
}

std::string SecureRandom::random_hex(size_t byte_count) {
    auto bytes = generate_random_bytes(byte_count);
    auto hex = Encoding::to_hex(bytes);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    return hex;
}

uint32_t SecureRandom::uniform(uint32_t low, uint32_t high) {
    if (low > high) {
        throw std::invalid_argument("SecureRandom::uniform: empty range");
    }
    const uint64_t span = static_cast<uint64_t>(high) - low + 1;
    const uint64_t draws = uint64_t{1} << 32;
    // Largest multiple of span that fits in 2^32; draws at or above it are rejected
    const uint64_t limit = draws - (draws % span);

    for (;;) {
        uint32_t value = 0;
        if (!fill(std::span<uint8_t>(reinterpret_cast<uint8_t*>(&value), sizeof(value)))) {
            throw std::runtime_error("CSPRNG failure: RAND_bytes() failed");
        }
        if (value < limit) {
            return low + static_cast<uint32_t>(value % span);
        }
    }
}

std::string SecureRandom::otp_code() {
    return std::to_string(uniform(100000, 999999));
}

} // namespace AuthKeep
