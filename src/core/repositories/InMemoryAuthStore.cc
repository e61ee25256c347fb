// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file InMemoryAuthStore.cc
 * @brief Implementation of the mutex-guarded store
 */

#include "InMemoryAuthStore.h"
#include "../../utils/Log.h"

#include <iterator>

namespace AuthKeep {

// ============================================================================
// Commit helpers
// ============================================================================

template<typename Record>
RepositoryResult<> InMemoryAuthStore::commit_row_locked(
    Table<Record>& table, const std::string& key, std::optional<Record> previous) {

    auto persisted = persist_locked();
    if (!persisted) {
        if (previous) {
            table.insert_or_assign(key, std::move(*previous));
        } else {
            table.erase(key);
        }
        return std::unexpected(persisted.error());
    }
    return {};
}

template<typename Record>
RepositoryResult<size_t> InMemoryAuthStore::purge_locked(
    Table<Record>& table, const std::function<bool(const Record&)>& expired) {

    std::vector<std::pair<std::string, Record>> removed;
    for (auto it = table.begin(); it != table.end();) {
        if (expired(it->second)) {
            removed.emplace_back(it->first, std::move(it->second));
            it = table.erase(it);
        } else {
            ++it;
        }
    }

    if (removed.empty()) {
        return size_t{0};
    }

    auto persisted = persist_locked();
    if (!persisted) {
        for (auto& [key, record] : removed) {
            table.insert_or_assign(key, std::move(record));
        }
        return std::unexpected(persisted.error());
    }
    return removed.size();
}

// ============================================================================
// OTP sessions
// ============================================================================

RepositoryResult<> InMemoryAuthStore::insert_session(const authkeep::OtpSessionRecord& session) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_otp_sessions.contains(session.session_id())) {
        return std::unexpected(RepositoryError::DUPLICATE_ID);
    }
    m_otp_sessions.emplace(session.session_id(), session);
    return commit_row_locked(m_otp_sessions, session.session_id(), std::optional<authkeep::OtpSessionRecord>{});
}

RepositoryResult<authkeep::OtpSessionRecord>
InMemoryAuthStore::find_session(std::string_view session_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_otp_sessions.find(session_id);
    if (it == m_otp_sessions.end()) {
        return std::unexpected(RepositoryError::NOT_FOUND);
    }
    return it->second;
}

RepositoryResult<OtpAttemptClaim> InMemoryAuthStore::claim_attempt(
    std::string_view session_id, uint32_t max_attempts, int64_t now_ms) {

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_otp_sessions.find(session_id);
    if (it == m_otp_sessions.end()) {
        return std::unexpected(RepositoryError::NOT_FOUND);
    }

    auto& session = it->second;
    if (session.used() || session.attempts() >= max_attempts || now_ms > session.expires_at()) {
        return OtpAttemptClaim{false, session};
    }

    auto previous = session;
    session.set_attempts(session.attempts() + 1);
    auto committed = commit_row_locked(m_otp_sessions, it->first, std::optional{std::move(previous)});
    if (!committed) {
        return std::unexpected(committed.error());
    }
    return OtpAttemptClaim{true, m_otp_sessions.find(session_id)->second};
}

RepositoryResult<bool> InMemoryAuthStore::mark_used(std::string_view session_id, int64_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_otp_sessions.find(session_id);
    if (it == m_otp_sessions.end()) {
        return std::unexpected(RepositoryError::NOT_FOUND);
    }

    auto& session = it->second;
    if (session.used()) {
        return false;
    }

    auto previous = session;
    session.set_used(true);
    session.set_used_at(now_ms);
    auto committed = commit_row_locked(m_otp_sessions, it->first, std::optional{std::move(previous)});
    if (!committed) {
        return std::unexpected(committed.error());
    }
    return true;
}

RepositoryResult<size_t> InMemoryAuthStore::delete_expired_sessions(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return purge_locked<authkeep::OtpSessionRecord>(m_otp_sessions,
        [now_ms](const authkeep::OtpSessionRecord& s) { return s.expires_at() < now_ms; });
}

// ============================================================================
// Rate limits
// ============================================================================

RepositoryResult<authkeep::RateLimitCounter> InMemoryAuthStore::increment_counter(
    std::string_view key, int64_t window_ms, int64_t now_ms) {

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_rate_limits.find(key);

    std::optional<authkeep::RateLimitCounter> previous;
    if (it == m_rate_limits.end()) {
        it = m_rate_limits.emplace(std::string(key), authkeep::RateLimitCounter{}).first;
        it->second.set_key(std::string(key));
    } else {
        previous = it->second;
    }

    auto& counter = it->second;
    if (!previous || now_ms >= counter.reset_at()) {
        // New window: count restarts at 1
        counter.set_window_start(now_ms);
        counter.set_count(1);
        counter.set_reset_at(now_ms + window_ms);
    } else {
        counter.set_count(counter.count() + 1);
    }

    auto committed = commit_row_locked(m_rate_limits, it->first, std::move(previous));
    if (!committed) {
        return std::unexpected(committed.error());
    }
    return m_rate_limits.find(key)->second;
}

RepositoryResult<size_t> InMemoryAuthStore::delete_expired_counters(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return purge_locked<authkeep::RateLimitCounter>(m_rate_limits,
        [now_ms](const authkeep::RateLimitCounter& c) { return c.reset_at() <= now_ms; });
}

// ============================================================================
// WebAuthn credentials
// ============================================================================

RepositoryResult<> InMemoryAuthStore::insert_credential(const authkeep::WebAuthnCredential& credential) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_credentials.contains(credential.credential_id())) {
        return std::unexpected(RepositoryError::DUPLICATE_ID);
    }
    m_credentials.emplace(credential.credential_id(), credential);
    return commit_row_locked(m_credentials, credential.credential_id(),
                             std::optional<authkeep::WebAuthnCredential>{});
}

RepositoryResult<authkeep::WebAuthnCredential>
InMemoryAuthStore::find_credential(std::string_view credential_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_credentials.find(credential_id);
    if (it == m_credentials.end()) {
        return std::unexpected(RepositoryError::NOT_FOUND);
    }
    return it->second;
}

RepositoryResult<std::vector<authkeep::WebAuthnCredential>>
InMemoryAuthStore::list_active_credentials(std::string_view hashed_identifier) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<authkeep::WebAuthnCredential> result;
    for (const auto& [id, credential] : m_credentials) {
        if (credential.is_active() && credential.hashed_identifier() == hashed_identifier) {
            result.push_back(credential);
        }
    }
    return result;
}

RepositoryResult<CounterUpdate> InMemoryAuthStore::advance_counter(
    std::string_view credential_id, uint64_t new_counter, int64_t now_ms) {

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_credentials.find(credential_id);
    if (it == m_credentials.end()) {
        return std::unexpected(RepositoryError::NOT_FOUND);
    }

    auto& credential = it->second;
    if (!credential.is_active() || credential.counter() >= new_counter) {
        return CounterUpdate{false, credential};
    }

    auto previous = credential;
    credential.set_counter(new_counter);
    credential.set_last_used_at(now_ms);
    auto committed = commit_row_locked(m_credentials, it->first, std::optional{std::move(previous)});
    if (!committed) {
        return std::unexpected(committed.error());
    }
    return CounterUpdate{true, m_credentials.find(credential_id)->second};
}

RepositoryResult<bool> InMemoryAuthStore::deactivate_credential(
    std::string_view credential_id, int64_t now_ms) {

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_credentials.find(credential_id);
    if (it == m_credentials.end()) {
        return std::unexpected(RepositoryError::NOT_FOUND);
    }

    auto& credential = it->second;
    if (!credential.is_active()) {
        return false;
    }

    auto previous = credential;
    credential.set_is_active(false);
    credential.set_deactivated_at(now_ms);
    auto committed = commit_row_locked(m_credentials, it->first, std::optional{std::move(previous)});
    if (!committed) {
        return std::unexpected(committed.error());
    }
    return true;
}

// ============================================================================
// WebAuthn challenges
// ============================================================================

RepositoryResult<> InMemoryAuthStore::store_challenge(const authkeep::WebAuthnChallenge& challenge) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::optional<authkeep::WebAuthnChallenge> previous;
    if (auto it = m_challenges.find(challenge.hashed_identifier()); it != m_challenges.end()) {
        previous = it->second;
    }
    m_challenges.insert_or_assign(challenge.hashed_identifier(), challenge);
    return commit_row_locked(m_challenges, challenge.hashed_identifier(), std::move(previous));
}

RepositoryResult<authkeep::WebAuthnChallenge>
InMemoryAuthStore::take_challenge(std::string_view hashed_identifier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_challenges.find(hashed_identifier);
    if (it == m_challenges.end()) {
        return std::unexpected(RepositoryError::NOT_FOUND);
    }

    auto taken = std::move(it->second);
    const std::string key = it->first;
    m_challenges.erase(it);

    auto persisted = persist_locked();
    if (!persisted) {
        m_challenges.insert_or_assign(key, taken);
        return std::unexpected(persisted.error());
    }
    return taken;
}

RepositoryResult<size_t> InMemoryAuthStore::delete_expired_challenges(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return purge_locked<authkeep::WebAuthnChallenge>(m_challenges,
        [now_ms](const authkeep::WebAuthnChallenge& c) { return c.expires_at() < now_ms; });
}

// ============================================================================
// Auth sessions
// ============================================================================

RepositoryResult<> InMemoryAuthStore::insert_auth_session(const authkeep::AuthSession& session) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_auth_sessions.contains(session.token_hash())) {
        return std::unexpected(RepositoryError::DUPLICATE_ID);
    }
    m_auth_sessions.emplace(session.token_hash(), session);
    return commit_row_locked(m_auth_sessions, session.token_hash(),
                             std::optional<authkeep::AuthSession>{});
}

RepositoryResult<authkeep::AuthSession>
InMemoryAuthStore::find_auth_session(std::string_view token_hash) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_auth_sessions.find(token_hash);
    if (it == m_auth_sessions.end()) {
        return std::unexpected(RepositoryError::NOT_FOUND);
    }
    return it->second;
}

RepositoryResult<size_t> InMemoryAuthStore::delete_expired_auth_sessions(int64_t now_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return purge_locked<authkeep::AuthSession>(m_auth_sessions,
        [now_ms](const authkeep::AuthSession& s) { return s.expires_at() < now_ms; });
}

// ============================================================================
// Audit
// ============================================================================

void InMemoryAuthStore::append(const authkeep::AuditLogEntry& entry) noexcept {
    try {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (auto persisted = persist_audit_locked(entry); !persisted) {
            Log::error("InMemoryAuthStore: failed to persist audit entry {}: {}",
                       entry.event_type(), to_string(persisted.error()));
            return;
        }
        m_audit_log.push_back(entry);
        while (m_audit_log.size() > MAX_AUDIT_TAIL) {
            m_audit_log.pop_front();
        }
    } catch (const std::exception& e) {
        Log::error("InMemoryAuthStore: failed to record audit entry {}: {}",
                   entry.event_type(), e.what());
    }
}

std::vector<authkeep::AuditLogEntry> InMemoryAuthStore::audit_entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<authkeep::AuditLogEntry>(m_audit_log.begin(), m_audit_log.end());
}

void InMemoryAuthStore::restore_audit_tail_locked(std::vector<authkeep::AuditLogEntry> entries) {
    const size_t skip = entries.size() > MAX_AUDIT_TAIL ? entries.size() - MAX_AUDIT_TAIL : 0;
    m_audit_log.assign(std::make_move_iterator(entries.begin() + static_cast<std::ptrdiff_t>(skip)),
                       std::make_move_iterator(entries.end()));
}

// ============================================================================
// Snapshots
// ============================================================================

authkeep::StoreSnapshot InMemoryAuthStore::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return snapshot_locked();
}

authkeep::StoreSnapshot InMemoryAuthStore::snapshot_locked() const {
    authkeep::StoreSnapshot snapshot;
    snapshot.set_schema_version(SNAPSHOT_SCHEMA_VERSION);
    for (const auto& [id, session] : m_otp_sessions) {
        *snapshot.add_otp_sessions() = session;
    }
    for (const auto& [key, counter] : m_rate_limits) {
        *snapshot.add_rate_limits() = counter;
    }
    for (const auto& [id, credential] : m_credentials) {
        *snapshot.add_credentials() = credential;
    }
    for (const auto& [subject, challenge] : m_challenges) {
        *snapshot.add_challenges() = challenge;
    }
    for (const auto& [hash, session] : m_auth_sessions) {
        *snapshot.add_sessions() = session;
    }
    return snapshot;
}

void InMemoryAuthStore::load_snapshot_locked(const authkeep::StoreSnapshot& snapshot) {
    m_otp_sessions.clear();
    m_rate_limits.clear();
    m_credentials.clear();
    m_challenges.clear();
    m_auth_sessions.clear();

    for (const auto& session : snapshot.otp_sessions()) {
        m_otp_sessions.insert_or_assign(session.session_id(), session);
    }
    for (const auto& counter : snapshot.rate_limits()) {
        m_rate_limits.insert_or_assign(counter.key(), counter);
    }
    for (const auto& credential : snapshot.credentials()) {
        m_credentials.insert_or_assign(credential.credential_id(), credential);
    }
    for (const auto& challenge : snapshot.challenges()) {
        m_challenges.insert_or_assign(challenge.hashed_identifier(), challenge);
    }
    for (const auto& session : snapshot.sessions()) {
        m_auth_sessions.insert_or_assign(session.token_hash(), session);
    }
}

} // namespace AuthKeep
