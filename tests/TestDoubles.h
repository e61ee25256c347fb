// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file TestDoubles.h
 * @brief Hand-written doubles shared by the test suites
 */

#pragma once

#include "../src/core/Clock.h"
#include "../src/core/crypto/KeyDerivationBackend.h"
#include "../src/core/delivery/ICodeDelivery.h"
#include "../src/core/services/CloneDetectionService.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace AuthKeep::Testing {

/**
 * @brief Clock that only moves when told to
 */
class ManualClock final : public IClock {
public:
    explicit ManualClock(TimePoint start = from_epoch_ms(1767225600000))  // 2026-01-01T00:00:00Z
        : m_now_ms(to_epoch_ms(start)) {}

    [[nodiscard]] TimePoint now() const noexcept override {
        return from_epoch_ms(m_now_ms.load());
    }

    template<typename Rep, typename Period>
    void advance(std::chrono::duration<Rep, Period> delta) {
        m_now_ms += std::chrono::duration_cast<std::chrono::milliseconds>(delta).count();
    }

    void set(TimePoint tp) { m_now_ms = to_epoch_ms(tp); }

private:
    std::atomic<int64_t> m_now_ms;
};

/**
 * @brief Assertion verifier driven by the test
 *
 * Accepts an assertion when its signature equals {0x01} and the expected
 * challenge was supplied; the counter is read from the authenticator data
 * so tests exercise parse_sign_count().
 */
class FakeAssertionVerifier final : public IAssertionVerifier {
public:
    [[nodiscard]] AuthResult<VerifiedAssertion> verify(
        const AssertionResponse& assertion,
        const AssertionExpectation& expected) const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_calls.push_back(expected);
        if (assertion.signature != std::vector<uint8_t>{0x01} || expected.challenge.empty()) {
            return std::unexpected(AuthError::AssertionInvalid);
        }
        auto counter = parse_sign_count(assertion.authenticator_data);
        if (!counter) {
            return std::unexpected(AuthError::AssertionInvalid);
        }
        return VerifiedAssertion{*counter};
    }

    [[nodiscard]] std::vector<AssertionExpectation> calls() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_calls;
    }

    /** @brief Authenticator data with the given signCount and zeroed rpIdHash */
    [[nodiscard]] static std::vector<uint8_t> authenticator_data(uint32_t sign_count) {
        std::vector<uint8_t> data(32, 0);
        data.push_back(0x05);  // UP | UV
        data.push_back(static_cast<uint8_t>(sign_count >> 24));
        data.push_back(static_cast<uint8_t>(sign_count >> 16));
        data.push_back(static_cast<uint8_t>(sign_count >> 8));
        data.push_back(static_cast<uint8_t>(sign_count));
        return data;
    }

    [[nodiscard]] static AssertionResponse valid_assertion(const std::string& credential_id,
                                                           uint32_t sign_count) {
        AssertionResponse assertion;
        assertion.credential_id = credential_id;
        assertion.authenticator_data = authenticator_data(sign_count);
        assertion.signature = {0x01};
        return assertion;
    }

private:
    mutable std::mutex m_mutex;
    mutable std::vector<AssertionExpectation> m_calls;
};

/**
 * @brief Delivery that keeps every message for inspection
 */
class RecordingCodeDelivery final : public ICodeDelivery {
public:
    struct Delivered {
        std::string identifier;
        std::string hashed_identifier;
        std::string code;
        std::chrono::minutes ttl;
    };

    [[nodiscard]] AuthResult<void> deliver(const CodeMessage& message) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_messages.push_back({std::string(message.identifier), std::string(message.hashed_identifier),
                              std::string(message.code), message.ttl});
        return {};
    }

    [[nodiscard]] std::vector<Delivered> messages() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_messages;
    }

    [[nodiscard]] std::optional<std::string> last_code() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_messages.empty()) {
            return std::nullopt;
        }
        return m_messages.back().code;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<Delivered> m_messages;
};

/**
 * @brief Delivery whose channel is always down
 */
class FailingCodeDelivery final : public ICodeDelivery {
public:
    [[nodiscard]] AuthResult<void> deliver(const CodeMessage&) override {
        ++attempts;
        return std::unexpected(AuthError::InternalError);
    }

    std::atomic<int> attempts{0};
};

/**
 * @brief Fast KDF parameters for tests (lowest values the validator accepts)
 */
[[nodiscard]] inline KdfParameters fast_kdf_parameters() {
    KdfParameters params;
    params.argon2_memory_cost_log2 = 12;
    params.argon2_time_cost = 2;
    params.pbkdf2_iterations = KdfParameters::MIN_PBKDF2_ITERATIONS;
    return params;
}

} // namespace AuthKeep::Testing
