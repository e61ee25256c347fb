// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file InMemoryAuthStore.h
 * @brief Mutex-guarded implementation of every store repository
 *
 * One lock covers all tables, so each conditional update in the
 * repository interfaces is atomic with respect to every other call.
 * Subclasses persist state through the persist_locked() hook, which runs
 * under that lock after each mutation; if it fails the mutation is rolled
 * back and SAVE_FAILED is returned.
 *
 * The store also records audit entries. Only the most recent
 * MAX_AUDIT_TAIL entries are kept in memory (see audit_entries()); audit
 * entries are not part of the snapshot and are persisted one at a time
 * through persist_audit_locked().
 */

#pragma once

#include "IAuthSessionRepository.h"
#include "IOtpSessionRepository.h"
#include "IRateLimitRepository.h"
#include "IWebAuthnRepository.h"
#include "../audit/IAuditSink.h"
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace AuthKeep {

class InMemoryAuthStore : public IOtpSessionRepository,
                          public IRateLimitRepository,
                          public IWebAuthnRepository,
                          public IAuthSessionRepository,
                          public IAuditSink {
public:
    /// Number of audit entries retained in memory
    static constexpr size_t MAX_AUDIT_TAIL = 10000;

    InMemoryAuthStore() = default;
    ~InMemoryAuthStore() override = default;

    // Non-copyable, non-movable (owns a mutex)
    InMemoryAuthStore(const InMemoryAuthStore&) = delete;
    InMemoryAuthStore& operator=(const InMemoryAuthStore&) = delete;
    InMemoryAuthStore(InMemoryAuthStore&&) = delete;
    InMemoryAuthStore& operator=(InMemoryAuthStore&&) = delete;

    // IOtpSessionRepository
    [[nodiscard]] RepositoryResult<> insert_session(
        const authkeep::OtpSessionRecord& session) override;
    [[nodiscard]] RepositoryResult<authkeep::OtpSessionRecord> find_session(
        std::string_view session_id) const override;
    [[nodiscard]] RepositoryResult<OtpAttemptClaim> claim_attempt(
        std::string_view session_id, uint32_t max_attempts, int64_t now_ms) override;
    [[nodiscard]] RepositoryResult<bool> mark_used(
        std::string_view session_id, int64_t now_ms) override;
    [[nodiscard]] RepositoryResult<size_t> delete_expired_sessions(int64_t now_ms) override;

    // IRateLimitRepository
    [[nodiscard]] RepositoryResult<authkeep::RateLimitCounter> increment_counter(
        std::string_view key, int64_t window_ms, int64_t now_ms) override;
    [[nodiscard]] RepositoryResult<size_t> delete_expired_counters(int64_t now_ms) override;

    // IWebAuthnRepository
    [[nodiscard]] RepositoryResult<> insert_credential(
        const authkeep::WebAuthnCredential& credential) override;
    [[nodiscard]] RepositoryResult<authkeep::WebAuthnCredential> find_credential(
        std::string_view credential_id) const override;
    [[nodiscard]] RepositoryResult<std::vector<authkeep::WebAuthnCredential>>
        list_active_credentials(std::string_view hashed_identifier) const override;
    [[nodiscard]] RepositoryResult<CounterUpdate> advance_counter(
        std::string_view credential_id, uint64_t new_counter, int64_t now_ms) override;
    [[nodiscard]] RepositoryResult<bool> deactivate_credential(
        std::string_view credential_id, int64_t now_ms) override;
    [[nodiscard]] RepositoryResult<> store_challenge(
        const authkeep::WebAuthnChallenge& challenge) override;
    [[nodiscard]] RepositoryResult<authkeep::WebAuthnChallenge> take_challenge(
        std::string_view hashed_identifier) override;
    [[nodiscard]] RepositoryResult<size_t> delete_expired_challenges(int64_t now_ms) override;

    // IAuthSessionRepository
    [[nodiscard]] RepositoryResult<> insert_auth_session(
        const authkeep::AuthSession& session) override;
    [[nodiscard]] RepositoryResult<authkeep::AuthSession> find_auth_session(
        std::string_view token_hash) const override;
    [[nodiscard]] RepositoryResult<size_t> delete_expired_auth_sessions(int64_t now_ms) override;

    // IAuditSink
    void append(const authkeep::AuditLogEntry& entry) noexcept override;

    /** @brief Copy of the retained audit entries, oldest first */
    [[nodiscard]] std::vector<authkeep::AuditLogEntry> audit_entries() const;

    /** @brief Full copy of the current state */
    [[nodiscard]] authkeep::StoreSnapshot snapshot() const;

protected:
    static constexpr uint32_t SNAPSHOT_SCHEMA_VERSION = 1;

    /**
     * @brief Persist the current state; called with the lock held
     *
     * The in-memory store has nothing to persist.
     */
    [[nodiscard]] virtual RepositoryResult<> persist_locked() { return {}; }

    /**
     * @brief Persist one audit entry; called with the lock held
     *
     * The entry is only added to the in-memory tail if this succeeds.
     */
    [[nodiscard]] virtual RepositoryResult<> persist_audit_locked(
        const authkeep::AuditLogEntry& /*entry*/) {
        return {};
    }

    /** @brief Build a snapshot; caller holds the lock */
    [[nodiscard]] authkeep::StoreSnapshot snapshot_locked() const;

    /** @brief Replace all state from a snapshot; caller holds the lock */
    void load_snapshot_locked(const authkeep::StoreSnapshot& snapshot);

    /** @brief Seed the audit tail with previously persisted entries; caller holds the lock */
    void restore_audit_tail_locked(std::vector<authkeep::AuditLogEntry> entries);

    mutable std::mutex m_mutex;

private:
    template<typename Record>
    using Table = std::map<std::string, Record, std::less<>>;

    /**
     * @brief Persist, or restore one row to its previous value on failure
     * @param previous Row before the mutation; empty if the row was inserted
     */
    template<typename Record>
    [[nodiscard]] RepositoryResult<> commit_row_locked(
        Table<Record>& table, const std::string& key, std::optional<Record> previous);

    /**
     * @brief Remove rows matching a predicate, persisting or restoring them
     */
    template<typename Record>
    [[nodiscard]] RepositoryResult<size_t> purge_locked(
        Table<Record>& table, const std::function<bool(const Record&)>& expired);

    Table<authkeep::OtpSessionRecord> m_otp_sessions;
    Table<authkeep::RateLimitCounter> m_rate_limits;
    Table<authkeep::WebAuthnCredential> m_credentials;
    Table<authkeep::WebAuthnChallenge> m_challenges;
    Table<authkeep::AuthSession> m_auth_sessions;
    std::deque<authkeep::AuditLogEntry> m_audit_log;
};

} // namespace AuthKeep
