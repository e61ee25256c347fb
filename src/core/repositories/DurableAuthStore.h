// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file DurableAuthStore.h
 * @brief File-backed store that survives process restarts
 *
 * After every mutation the whole state is serialized as a protobuf
 * StoreSnapshot and written atomically (see StoreIO). A failed write
 * rolls the mutation back, so memory never runs ahead of disk.
 *
 * Audit entries are not part of the snapshot. Each one is appended to
 * "<path>.audit" as a 4-byte big-endian length followed by a serialized
 * AuditLogEntry. When that file would grow past the configured limit it
 * is renamed to "<path>.audit.1" (replacing any earlier one) and a new
 * file is started, so snapshot writes stay proportional to live state and
 * audit storage stays bounded.
 */

#pragma once

#include "InMemoryAuthStore.h"
#include "../AuthError.h"
#include <filesystem>
#include <memory>

namespace AuthKeep {

class DurableAuthStore final : public InMemoryAuthStore {
public:
    /// Snapshots larger than this are refused on load and on save
    static constexpr size_t MAX_SNAPSHOT_SIZE = 100 * 1024 * 1024;

    /// Audit file size at which the file is rotated
    static constexpr size_t DEFAULT_MAX_AUDIT_FILE_SIZE = 64 * 1024 * 1024;

    /// Largest single serialized audit entry accepted
    static constexpr size_t MAX_AUDIT_RECORD_SIZE = 64 * 1024;

    /**
     * @brief Open a store file, creating an empty store if it does not exist
     *
     * The most recent audit entries are reloaded from the audit file. A
     * record cut short by a crash during an append is dropped from the
     * end of the file.
     *
     * @param path Snapshot file
     * @param max_audit_file_size Rotation threshold for the audit file
     * @return Store, ConfigurationError if a file is a symlink, has
     *         insecure permissions or holds an unsupported schema version,
     *         InternalError if it cannot be read or parsed
     */
    [[nodiscard]] static AuthResult<std::unique_ptr<DurableAuthStore>> open(
        const std::filesystem::path& path,
        size_t max_audit_file_size = DEFAULT_MAX_AUDIT_FILE_SIZE);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }
    [[nodiscard]] const std::filesystem::path& audit_path() const noexcept { return m_audit_path; }

protected:
    [[nodiscard]] RepositoryResult<> persist_locked() override;
    [[nodiscard]] RepositoryResult<> persist_audit_locked(
        const authkeep::AuditLogEntry& entry) override;

private:
    DurableAuthStore(std::filesystem::path path, size_t max_audit_file_size);

    /// Load the audit tail and drop a torn trailing record; caller holds the lock
    [[nodiscard]] AuthResult<void> load_audit_log_locked();

    std::filesystem::path m_path;
    std::filesystem::path m_audit_path;
    size_t m_max_audit_file_size;
    size_t m_audit_file_size{0};
};

} // namespace AuthKeep
