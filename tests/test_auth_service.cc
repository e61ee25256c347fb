// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "../src/core/repositories/InMemoryAuthStore.h"
#include "../src/core/services/AuthService.h"
#include "../src/core/services/IdentifierHashService.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <format>

using namespace AuthKeep;
using namespace AuthKeep::Testing;
using namespace std::chrono_literals;

namespace {

std::string wrong_code_for(const std::string& code) {
    return code == "000000" ? "111111" : "000000";
}

} // namespace

class AuthServiceTest : public ::testing::Test {
protected:
    static constexpr std::string_view USER = "alice@example.com";

    void SetUp() override {
        meta.ip_address = "198.51.100.4";
        meta.user_agent = "test-agent/1.0";
        rebuild(&delivery, false);
    }

    void rebuild(ICodeDelivery* channel, bool production) {
        AuthServiceSettings settings;
        settings.production = production;
        service = std::make_unique<AuthService>(&otp, &limiter, &webauthn, &store, channel,
                                                &store, &clock, settings);
    }

    [[nodiscard]] size_t count_events(std::string_view type) const {
        const auto entries = store.audit_entries();
        return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
            [type](const authkeep::AuditLogEntry& e) { return e.event_type() == type; }));
    }

    ManualClock clock;
    InMemoryAuthStore store;
    RecordingCodeDelivery delivery;
    FakeAssertionVerifier verifier;
    RateLimiter limiter{&store, &clock};
    OtpSessionService otp{&store, &store, &clock};
    CloneDetectionService webauthn{&store, &verifier, &store, &clock};
    std::unique_ptr<AuthService> service;
    ClientMeta meta;
};

// ============================================================================
// OTP flow
// ============================================================================

TEST_F(AuthServiceTest, InitiateVerifyAndReplay) {
    auto initiated = service->initiate(USER, meta);
    ASSERT_TRUE(initiated.has_value());
    EXPECT_EQ(initiated->session_id.size(), 64u);
    EXPECT_EQ(initiated->expires_in_seconds, 300);
    EXPECT_TRUE(initiated->delivered);
    ASSERT_TRUE(initiated->code.has_value());
    EXPECT_EQ(delivery.last_code(), initiated->code);

    auto verified = service->verify(initiated->session_id, *initiated->code, meta);
    ASSERT_TRUE(verified.has_value());
    EXPECT_TRUE(verified->success);
    ASSERT_TRUE(verified->session_token.has_value());
    EXPECT_EQ(verified->session_token->size(), 2 * AuthService::SESSION_TOKEN_BYTES);

    auto replay = service->verify(initiated->session_id, *initiated->code, meta);
    ASSERT_FALSE(replay.has_value());
    EXPECT_EQ(replay.error().code, AuthError::AlreadyUsed);
    EXPECT_EQ(replay.error().message(), "OTP has already been used");
}

TEST_F(AuthServiceTest, DeliveredMessageCarriesIdentifierAndTtl) {
    ASSERT_TRUE(service->initiate(USER, meta).has_value());

    const auto messages = delivery.messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].identifier, USER);
    EXPECT_EQ(messages[0].hashed_identifier, *IdentifierHashService::hash_identifier(USER));
    EXPECT_EQ(messages[0].ttl, 5min);
}

TEST_F(AuthServiceTest, ProductionNeverReturnsCode) {
    rebuild(&delivery, true);
    auto initiated = service->initiate(USER, meta);
    ASSERT_TRUE(initiated.has_value());
    EXPECT_FALSE(initiated->code.has_value());
    EXPECT_TRUE(delivery.last_code().has_value());
}

TEST_F(AuthServiceTest, WrongCodeReportsRemainingAttempts) {
    auto initiated = service->initiate(USER, meta);
    ASSERT_TRUE(initiated.has_value());
    const std::string wrong = wrong_code_for(*initiated->code);

    auto first = service->verify(initiated->session_id, wrong, meta);
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first->success);
    EXPECT_EQ(first->attempts_remaining, 2u);
    EXPECT_FALSE(first->session_token.has_value());

    EXPECT_EQ(service->verify(initiated->session_id, wrong, meta)->attempts_remaining, 1u);
    EXPECT_EQ(service->verify(initiated->session_id, wrong, meta)->attempts_remaining, 0u);

    auto exhausted = service->verify(initiated->session_id, *initiated->code, meta);
    ASSERT_FALSE(exhausted.has_value());
    EXPECT_EQ(exhausted.error().code, AuthError::AttemptsExceeded);
    EXPECT_EQ(exhausted.error().attempts_remaining, 0u);
}

TEST_F(AuthServiceTest, ExpiredSessionIsRejected) {
    auto initiated = service->initiate(USER, meta);
    ASSERT_TRUE(initiated.has_value());

    clock.advance(5min + 1ms);
    auto result = service->verify(initiated->session_id, *initiated->code, meta);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AuthError::Expired);
}

TEST_F(AuthServiceTest, InvalidIdentifierIsValidationError) {
    auto result = service->initiate("   ", meta);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, AuthError::ValidationError);
    EXPECT_TRUE(delivery.messages().empty());
}

TEST_F(AuthServiceTest, DeliveryFailureStillIssuesSession) {
    FailingCodeDelivery failing;
    rebuild(&failing, false);

    auto initiated = service->initiate(USER, meta);
    ASSERT_TRUE(initiated.has_value());
    EXPECT_FALSE(initiated->delivered);
    EXPECT_EQ(failing.attempts.load(), 1);
    EXPECT_EQ(count_events(AuditEvent::OtpDeliveryFailed), 1u);

    // The session exists and the code still verifies
    auto verified = service->verify(initiated->session_id, *initiated->code, meta);
    ASSERT_TRUE(verified.has_value());
    EXPECT_TRUE(verified->success);
}

// ============================================================================
// Rate limiting
// ============================================================================

TEST_F(AuthServiceTest, InitiateLimitedPerIdentifier) {
    const uint32_t limit = limiter.policies().initiate_per_identifier.limit;
    for (uint32_t i = 0; i < limit; ++i) {
        ASSERT_TRUE(service->initiate(USER, meta).has_value()) << "request " << i;
    }

    auto refused = service->initiate(USER, meta);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, AuthError::RateLimited);
    EXPECT_EQ(refused.error().retry_after, 3600s);
    EXPECT_EQ(count_events(AuditEvent::RateLimitExceeded), 1u);
    EXPECT_EQ(delivery.messages().size(), limit);

    // Another identifier from the same address is unaffected
    EXPECT_TRUE(service->initiate("bob@example.com", meta).has_value());

    clock.advance(1h);
    EXPECT_TRUE(service->initiate(USER, meta).has_value());
}

TEST_F(AuthServiceTest, InitiateLimitedPerIp) {
    const uint32_t limit = limiter.policies().initiate_per_ip.limit;
    for (uint32_t i = 0; i < limit; ++i) {
        ASSERT_TRUE(service->initiate(std::format("user{}@example.com", i), meta).has_value());
    }

    auto refused = service->initiate("late@example.com", meta);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, AuthError::RateLimited);
    EXPECT_GE(refused.error().retry_after, 1s);

    ClientMeta elsewhere = meta;
    elsewhere.ip_address = "203.0.113.9";
    EXPECT_TRUE(service->initiate("late@example.com", elsewhere).has_value());
}

TEST_F(AuthServiceTest, VerifyLimitedPerSession) {
    auto initiated = service->initiate(USER, meta);
    ASSERT_TRUE(initiated.has_value());
    const std::string wrong = wrong_code_for(*initiated->code);

    const uint32_t limit = limiter.policies().verify_per_session.limit;
    for (uint32_t i = 0; i < limit; ++i) {
        auto result = service->verify(initiated->session_id, wrong, meta);
        if (result) {
            EXPECT_FALSE(result->success);
        } else {
            EXPECT_EQ(result.error().code, AuthError::AttemptsExceeded);
        }
    }

    auto refused = service->verify(initiated->session_id, wrong, meta);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, AuthError::RateLimited);
    EXPECT_EQ(refused.error().retry_after, 60s);
}

TEST_F(AuthServiceTest, RateLimitAuditNeverContainsAddress) {
    const uint32_t limit = limiter.policies().initiate_per_identifier.limit;
    for (uint32_t i = 0; i <= limit; ++i) {
        (void)service->initiate(USER, meta);
    }
    for (const auto& entry : store.audit_entries()) {
        EXPECT_EQ(entry.subject_hash().find(meta.ip_address), std::string::npos);
        for (const auto& [key, value] : entry.details()) {
            EXPECT_EQ(value.find(meta.ip_address), std::string::npos) << key;
            EXPECT_EQ(value.find(USER), std::string::npos) << key;
        }
    }
}

// ============================================================================
// Session tokens
// ============================================================================

TEST_F(AuthServiceTest, SessionTokenValidatesUntilExpiry) {
    auto initiated = service->initiate(USER, meta);
    ASSERT_TRUE(initiated.has_value());
    auto verified = service->verify(initiated->session_id, *initiated->code, meta);
    ASSERT_TRUE(verified.has_value());
    ASSERT_TRUE(verified->session_token.has_value());

    auto info = service->validate_session_token(*verified->session_token);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->hashed_identifier, *IdentifierHashService::hash_identifier(USER));
    EXPECT_EQ(info->method, "otp");
    EXPECT_EQ(info->expires_at, clock.now() + 60min);
    EXPECT_EQ(count_events(AuditEvent::SessionIssued), 1u);

    // Only the hash is stored
    for (const auto& session : store.snapshot().sessions()) {
        EXPECT_NE(session.token_hash(), *verified->session_token);
    }

    clock.advance(60min + 1ms);
    auto expired = service->validate_session_token(*verified->session_token);
    ASSERT_FALSE(expired.has_value());
    EXPECT_EQ(expired.error().code, AuthError::Expired);
}

TEST_F(AuthServiceTest, UnknownSessionTokenIsNotFound) {
    auto info = service->validate_session_token("not-a-token");
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code, AuthError::NotFound);
}

// ============================================================================
// WebAuthn
// ============================================================================

TEST_F(AuthServiceTest, WebAuthnCompleteIssuesToken) {
    authkeep::WebAuthnCredential credential;
    credential.set_credential_id("cred-1");
    credential.set_hashed_identifier(*IdentifierHashService::hash_identifier(USER));
    credential.set_public_key("cose");
    credential.set_is_active(true);
    ASSERT_TRUE(store.insert_credential(credential).has_value());

    auto options = service->webauthn_start(USER);
    ASSERT_TRUE(options.has_value());
    ASSERT_EQ(options->allow_credentials.size(), 1u);

    auto completed = service->webauthn_complete(USER, FakeAssertionVerifier::valid_assertion("cred-1", 1));
    ASSERT_TRUE(completed.has_value());
    EXPECT_TRUE(completed->success);

    auto info = service->validate_session_token(completed->session_token);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->method, "webauthn");

    // Replaying the same counter is a clone
    ASSERT_TRUE(service->webauthn_start(USER).has_value());
    auto cloned = service->webauthn_complete(USER, FakeAssertionVerifier::valid_assertion("cred-1", 1));
    ASSERT_FALSE(cloned.has_value());
    EXPECT_EQ(cloned.error().code, AuthError::CloneDetected);
}

TEST_F(AuthServiceTest, WebAuthnStartWithoutCredentials) {
    auto options = service->webauthn_start(USER);
    ASSERT_TRUE(options.has_value());
    EXPECT_TRUE(options->allow_credentials.empty());
}

// ============================================================================
// Maintenance
// ============================================================================

TEST_F(AuthServiceTest, SweepRemovesExpiredState) {
    auto initiated = service->initiate(USER, meta);
    ASSERT_TRUE(initiated.has_value());
    ASSERT_TRUE(service->verify(initiated->session_id, *initiated->code, meta).has_value());
    ASSERT_TRUE(service->webauthn_start(USER).has_value());

    auto early = service->sweep_expired();
    ASSERT_TRUE(early.has_value());
    EXPECT_EQ(early->otp_sessions, 0u);
    EXPECT_EQ(early->auth_sessions, 0u);

    clock.advance(2h);
    auto report = service->sweep_expired();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->otp_sessions, 1u);
    EXPECT_EQ(report->rate_limit_counters, 4u);  // two initiate scopes, two verify scopes
    EXPECT_EQ(report->webauthn_challenges, 1u);
    EXPECT_EQ(report->auth_sessions, 1u);

    const auto snapshot = store.snapshot();
    EXPECT_EQ(snapshot.otp_sessions_size(), 0);
    EXPECT_EQ(snapshot.rate_limits_size(), 0);
    EXPECT_EQ(snapshot.challenges_size(), 0);
    EXPECT_EQ(snapshot.sessions_size(), 0);
}

TEST(AuthServiceConstruction, NullCollaboratorsThrow) {
    ManualClock clock;
    InMemoryAuthStore store;
    RecordingCodeDelivery delivery;
    FakeAssertionVerifier verifier;
    RateLimiter limiter{&store, &clock};
    OtpSessionService otp{&store, &store, &clock};
    CloneDetectionService webauthn{&store, &verifier, &store, &clock};

    EXPECT_THROW(AuthService(nullptr, &limiter, &webauthn, &store, &delivery, &store, &clock),
                 std::invalid_argument);
    EXPECT_THROW(AuthService(&otp, &limiter, &webauthn, &store, nullptr, &store, &clock),
                 std::invalid_argument);
}
