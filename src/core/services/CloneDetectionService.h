// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file CloneDetectionService.h
 * @brief WebAuthn challenge issuance and signature-counter enforcement
 *
 * A hardware authenticator increments its signature counter on every
 * assertion. Two devices sharing one key (a clone) cannot both keep the
 * counter strictly increasing, so any assertion whose counter is not
 * greater than the stored value permanently disables the credential.
 *
 * Signature verification itself is delegated to an injected
 * IAssertionVerifier; this service only binds challenges to users and
 * enforces counter monotonicity.
 */

#pragma once

#include "../AuthError.h"
#include "../Clock.h"
#include "../audit/IAuditSink.h"
#include "../repositories/IWebAuthnRepository.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace AuthKeep {

/**
 * @brief Relying-party settings
 */
struct WebAuthnSettings {
    std::string rp_id{"localhost"};
    std::vector<std::string> origins{"https://localhost"};
    std::chrono::milliseconds timeout{60000};        ///< Client-side ceremony timeout
    std::chrono::minutes challenge_ttl{10};
};

/**
 * @brief Options returned to the client to start an assertion ceremony
 */
struct AuthenticationOptions {
    std::vector<uint8_t> challenge;
    std::vector<std::string> allow_credentials;
    std::string rp_id;
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Assertion as received from the client
 */
struct AssertionResponse {
    std::string credential_id;
    std::vector<uint8_t> client_data_json;
    std::vector<uint8_t> authenticator_data;
    std::vector<uint8_t> signature;
    std::vector<uint8_t> user_handle;
};

/**
 * @brief What the verifier must check the assertion against
 */
struct AssertionExpectation {
    std::vector<uint8_t> challenge;
    std::string rp_id;
    std::vector<std::string> origins;
    std::string public_key;           ///< Stored COSE key bytes
    TimePoint challenge_expires_at;
};

/**
 * @brief Verifier output for a valid assertion
 */
struct VerifiedAssertion {
    uint32_t new_counter{0};
};

/**
 * @brief FIDO2 signature-verification primitive
 *
 * Must confirm the signature against public_key, that clientDataJSON
 * carries the expected challenge and one of the allowed origins, and that
 * the rpIdHash matches rp_id. Any failure is reported as AssertionInvalid.
 */
class IAssertionVerifier {
public:
    virtual ~IAssertionVerifier() = default;

    [[nodiscard]] virtual AuthResult<VerifiedAssertion> verify(
        const AssertionResponse& assertion,
        const AssertionExpectation& expected) const = 0;
};

/**
 * @brief Read signCount from raw authenticator data
 *
 * Layout: rpIdHash (32) || flags (1) || signCount (4, big-endian) || ...
 *
 * @return Counter, or std::nullopt if the data is shorter than 37 bytes
 */
[[nodiscard]] std::optional<uint32_t> parse_sign_count(std::span<const uint8_t> authenticator_data) noexcept;

/**
 * @brief Result of a successful second-factor authentication
 */
struct WebAuthnAuthentication {
    std::string hashed_identifier;
    std::string credential_id;
    uint64_t counter{0};
};

class CloneDetectionService {
public:
    static constexpr size_t CHALLENGE_BYTES = 32;

    /**
     * @param repository Non-owning credential/challenge store
     * @param verifier Non-owning signature verifier
     * @param audit Non-owning audit sink
     * @param clock Non-owning time source
     * @throws std::invalid_argument if any pointer is null
     */
    CloneDetectionService(IWebAuthnRepository* repository,
                          const IAssertionVerifier* verifier,
                          IAuditSink* audit,
                          const IClock* clock,
                          WebAuthnSettings settings = {});

    CloneDetectionService(const CloneDetectionService&) = delete;
    CloneDetectionService& operator=(const CloneDetectionService&) = delete;
    CloneDetectionService(CloneDetectionService&&) = delete;
    CloneDetectionService& operator=(CloneDetectionService&&) = delete;

    /**
     * @brief Issue a fresh challenge for a user
     *
     * Replaces any pending challenge. A user with no active credentials
     * gets an empty allow list rather than an error, so the response does
     * not reveal whether the identifier is enrolled.
     *
     * @throws std::runtime_error if the CSPRNG fails
     */
    [[nodiscard]] AuthResult<AuthenticationOptions> start_authentication(std::string_view identifier);

    /**
     * @brief Verify an assertion and enforce counter monotonicity
     *
     * The pending challenge is consumed before verification, so every
     * failure requires a new start_authentication().
     *
     * @return Authentication on success;
     *         CredentialNotFoundOrInactive if the credential is missing,
     *         disabled or owned by someone else;
     *         AssertionInvalid if there is no live challenge or the verifier
     *         rejects the assertion;
     *         CloneDetected if the counter did not increase (the credential
     *         is disabled permanently)
     */
    [[nodiscard]] AuthResult<WebAuthnAuthentication> complete_authentication(
        std::string_view identifier,
        const AssertionResponse& assertion);

    /** @brief Purge challenges past their expiry */
    [[nodiscard]] AuthResult<size_t> cleanup_expired();

    [[nodiscard]] const WebAuthnSettings& settings() const noexcept { return m_settings; }

private:
    [[nodiscard]] AuthError reject_clone(const authkeep::WebAuthnCredential& credential,
                                         uint64_t presented_counter, int64_t now_ms);

    IWebAuthnRepository* m_repository;
    const IAssertionVerifier* m_verifier;
    IAuditSink* m_audit;
    const IClock* m_clock;
    WebAuthnSettings m_settings;
};

} // namespace AuthKeep
