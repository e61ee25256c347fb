// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "Argon2idBackend.h"
#include "SecureRandom.h"
#include "../../utils/Log.h"
#include <array>
#include <argon2.h>

namespace AuthKeep {

AuthResult<void> Argon2idBackend::check_parameters(const KdfParameters& params) noexcept {
    if (params.argon2_memory_cost_log2 < MIN_MEMORY_COST_LOG2 ||
        params.argon2_memory_cost_log2 > MAX_MEMORY_COST_LOG2) {
        Log::error("Argon2idBackend: memory cost exponent {} outside [{}, {}]",
                   params.argon2_memory_cost_log2, MIN_MEMORY_COST_LOG2, MAX_MEMORY_COST_LOG2);
        return std::unexpected(AuthError::ConfigurationError);
    }
    if (params.argon2_time_cost < 1 || params.argon2_time_cost > MAX_TIME_COST) {
        Log::error("Argon2idBackend: time cost {} outside [1, {}]",
                   params.argon2_time_cost, MAX_TIME_COST);
        return std::unexpected(AuthError::ConfigurationError);
    }
    if (params.argon2_parallelism != 1) {
        Log::error("Argon2idBackend: parallelism must be 1 (got {})", params.argon2_parallelism);
        return std::unexpected(AuthError::ConfigurationError);
    }
    return {};
}

AuthResult<SecureVector<uint8_t>> Argon2idBackend::derive_key(
    std::string_view passphrase,
    std::span<const uint8_t> salt,
    const KdfParameters& params) const noexcept {

    if (salt.size() < MIN_SALT_LENGTH) {
        Log::error("Argon2idBackend: Salt too short ({} bytes, minimum {})",
                   salt.size(), MIN_SALT_LENGTH);
        return std::unexpected(AuthError::ValidationError);
    }
    if (auto valid = check_parameters(params); !valid) {
        return std::unexpected(valid.error());
    }

    SecureVector<uint8_t> key(KEY_LENGTH);

    int result = argon2id_hash_raw(
        params.argon2_time_cost,      // t_cost (iterations)
        params.argon2_memory_kib(),   // m_cost (memory in KiB)
        params.argon2_parallelism,    // parallelism (lanes)
        passphrase.data(),
        passphrase.size(),
        salt.data(),
        salt.size(),
        key.data(),
        key.size()
    );

    if (result != ARGON2_OK) {
        Log::error("Argon2idBackend: derivation failed: {}", argon2_error_message(result));
        return std::unexpected(AuthError::InternalError);
    }

    Log::debug("Argon2idBackend: key derived (2^{} KiB, t={}, p={})",
               params.argon2_memory_cost_log2, params.argon2_time_cost,
               params.argon2_parallelism);
    return key;
}

AuthResult<std::string> Argon2idBackend::hash_passphrase(
    std::string_view passphrase,
    const KdfParameters& params) const noexcept {

    if (auto valid = check_parameters(params); !valid) {
        return std::unexpected(valid.error());
    }

    std::array<uint8_t, HASH_SALT_LENGTH> salt{};
    if (!SecureRandom::fill(salt)) {
        Log::error("Argon2idBackend: CSPRNG failure while generating salt");
        return std::unexpected(AuthError::InternalError);
    }

    const size_t encoded_len = argon2_encodedlen(
        params.argon2_time_cost, params.argon2_memory_kib(), params.argon2_parallelism,
        static_cast<uint32_t>(salt.size()), static_cast<uint32_t>(KEY_LENGTH), Argon2_id);

    std::string encoded(encoded_len, '\0');
    int result = argon2id_hash_encoded(
        params.argon2_time_cost,
        params.argon2_memory_kib(),
        params.argon2_parallelism,
        passphrase.data(),
        passphrase.size(),
        salt.data(),
        salt.size(),
        KEY_LENGTH,
        encoded.data(),
        encoded.size()
    );

    if (result != ARGON2_OK) {
        Log::error("Argon2idBackend: encoded hash failed: {}", argon2_error_message(result));
        return std::unexpected(AuthError::InternalError);
    }

    // argon2_encodedlen includes the terminating NUL
    if (auto nul = encoded.find('\0'); nul != std::string::npos) {
        encoded.resize(nul);
    }
    return encoded;
}

bool Argon2idBackend::verify_passphrase(
    std::string_view passphrase,
    std::string_view encoded_hash) const noexcept {

    if (!recognizes(encoded_hash)) {
        return false;
    }

    // argon2id_verify needs a NUL-terminated string
    const std::string encoded(encoded_hash);
    int result = argon2id_verify(encoded.c_str(), passphrase.data(), passphrase.size());
    if (result != ARGON2_OK && result != ARGON2_VERIFY_MISMATCH) {
        Log::debug("Argon2idBackend: verify rejected hash: {}", argon2_error_message(result));
    }
    return result == ARGON2_OK;
}

bool Argon2idBackend::recognizes(std::string_view encoded_hash) const noexcept {
    return encoded_hash.starts_with("$argon2id$");
}

bool Argon2idBackend::self_test() const noexcept {
    static constexpr std::string_view probe_passphrase{"authkeep-argon2-probe"};
    static constexpr std::array<uint8_t, MIN_SALT_LENGTH> probe_salt{
        0x61, 0x75, 0x74, 0x68, 0x6b, 0x65, 0x65, 0x70,
        0x2d, 0x70, 0x72, 0x6f, 0x62, 0x65, 0x2d, 0x31};

    KdfParameters probe;
    probe.algorithm = KdfAlgorithm::ARGON2ID;
    probe.argon2_memory_cost_log2 = MIN_MEMORY_COST_LOG2;
    probe.argon2_time_cost = 1;
    probe.argon2_parallelism = 1;

    auto first = derive_key(probe_passphrase, probe_salt, probe);
    auto second = derive_key(probe_passphrase, probe_salt, probe);
    if (!first || !second) {
        return false;
    }
    return *first == *second;
}

} // namespace AuthKeep
