// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

/**
 * @file StoreIO.h
 * @brief Owner-only, crash-safe file I/O for store snapshots and spool files
 *
 * Writes go to "<path>.tmp", are fsync'd, renamed over the target (atomic
 * on POSIX) and the parent directory is fsync'd so the rename itself is
 * durable. Files are created with mode 0600.
 *
 * Append-only logs (the audit trail) are extended in place with O_APPEND
 * and fsync'd after every record instead of being rewritten.
 *
 * Reads open with O_NOFOLLOW and check permissions on the opened
 * descriptor, so a symlink or a group/world-readable file is refused
 * without a check-then-open race.
 */

#pragma once

#include "../AuthError.h"
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace AuthKeep {

class StoreIO {
public:
    StoreIO() = delete;

    /// Refuse to load anything larger than this
    static constexpr size_t MAX_FILE_SIZE = 256 * 1024 * 1024;

    /**
     * @brief Read a whole file
     * @return Contents, NotFound if the file does not exist,
     *         ConfigurationError for insecure permissions or a symlink,
     *         InternalError for I/O failures
     */
    [[nodiscard]] static AuthResult<std::vector<uint8_t>> read_file(const std::filesystem::path& path);

    /**
     * @brief Atomically replace a file with new contents (mode 0600)
     * @return InternalError on any I/O failure; the previous contents are
     *         left untouched in that case
     */
    [[nodiscard]] static AuthResult<void> write_file(
        const std::filesystem::path& path,
        std::span<const uint8_t> data);

    /**
     * @brief Append bytes to the end of a file, creating it with mode 0600
     *
     * The data is written and fsync'd before returning. If the write fails
     * part way, the file is truncated back to its previous length.
     *
     * @return Size of the file after the append, ConfigurationError for a
     *         symlink, a non-regular file or insecure permissions,
     *         InternalError for I/O failures
     */
    [[nodiscard]] static AuthResult<size_t> append_file(
        const std::filesystem::path& path,
        std::span<const uint8_t> data);
};

} // namespace AuthKeep
