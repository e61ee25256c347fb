// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "DurableAuthStore.h"
#include "../io/StoreIO.h"
#include "../../utils/Log.h"

#include <string>
#include <system_error>
#include <vector>

namespace AuthKeep {

namespace {

constexpr size_t AUDIT_LENGTH_PREFIX = 4;

uint32_t read_be32(const uint8_t* p) noexcept {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

}  // namespace

DurableAuthStore::DurableAuthStore(std::filesystem::path path, size_t max_audit_file_size)
    : m_path(std::move(path)),
      m_audit_path(m_path.string() + ".audit"),
      m_max_audit_file_size(max_audit_file_size) {
}

AuthResult<std::unique_ptr<DurableAuthStore>>
DurableAuthStore::open(const std::filesystem::path& path, size_t max_audit_file_size) {
    std::unique_ptr<DurableAuthStore> store(new DurableAuthStore(path, max_audit_file_size));
    std::lock_guard<std::mutex> lock(store->m_mutex);

    auto data = StoreIO::read_file(path);
    if (!data) {
        if (data.error() != AuthError::NotFound) {
            return std::unexpected(data.error());
        }
        Log::info("DurableAuthStore: no store at {}, starting empty", path.string());
    } else {
        if (data->size() > MAX_SNAPSHOT_SIZE) {
            Log::error("DurableAuthStore: snapshot exceeds maximum size ({} bytes > {} bytes)",
                       data->size(), MAX_SNAPSHOT_SIZE);
            return std::unexpected(AuthError::InternalError);
        }

        authkeep::StoreSnapshot snapshot;
        if (!snapshot.ParseFromArray(data->data(), static_cast<int>(data->size()))) {
            Log::error("DurableAuthStore: failed to parse snapshot {}", path.string());
            return std::unexpected(AuthError::InternalError);
        }

        if (snapshot.schema_version() != SNAPSHOT_SCHEMA_VERSION) {
            Log::error("DurableAuthStore: unsupported schema version {} in {}",
                       snapshot.schema_version(), path.string());
            return std::unexpected(AuthError::ConfigurationError);
        }

        store->load_snapshot_locked(snapshot);
        Log::info("DurableAuthStore: loaded {} OTP sessions, {} credentials from {}",
                  snapshot.otp_sessions_size(), snapshot.credentials_size(), path.string());
    }

    if (auto audit = store->load_audit_log_locked(); !audit) {
        return std::unexpected(audit.error());
    }
    return store;
}

AuthResult<void> DurableAuthStore::load_audit_log_locked() {
    auto data = StoreIO::read_file(m_audit_path);
    if (!data) {
        if (data.error() == AuthError::NotFound) {
            m_audit_file_size = 0;
            return {};
        }
        return std::unexpected(data.error());
    }

    std::vector<authkeep::AuditLogEntry> entries;
    size_t offset = 0;
    while (data->size() - offset >= AUDIT_LENGTH_PREFIX) {
        const size_t length = read_be32(data->data() + offset);
        if (length > MAX_AUDIT_RECORD_SIZE) {
            Log::error("DurableAuthStore: oversized audit record at offset {} in {}",
                       offset, m_audit_path.string());
            return std::unexpected(AuthError::InternalError);
        }
        if (data->size() - offset - AUDIT_LENGTH_PREFIX < length) {
            break;  // torn record from an interrupted append
        }

        authkeep::AuditLogEntry entry;
        if (!entry.ParseFromArray(data->data() + offset + AUDIT_LENGTH_PREFIX,
                                  static_cast<int>(length))) {
            Log::error("DurableAuthStore: corrupt audit record at offset {} in {}",
                       offset, m_audit_path.string());
            return std::unexpected(AuthError::InternalError);
        }
        entries.push_back(std::move(entry));
        offset += AUDIT_LENGTH_PREFIX + length;
    }

    if (offset != data->size()) {
        Log::warning("DurableAuthStore: dropping {} trailing bytes of a torn audit record in {}",
                     data->size() - offset, m_audit_path.string());
        std::error_code ec;
        std::filesystem::resize_file(m_audit_path, offset, ec);
        if (ec) {
            Log::error("DurableAuthStore: failed to truncate {} ({})",
                       m_audit_path.string(), ec.message());
            return std::unexpected(AuthError::InternalError);
        }
    }

    m_audit_file_size = offset;
    restore_audit_tail_locked(std::move(entries));
    return {};
}

RepositoryResult<> DurableAuthStore::persist_locked() {
    std::string serialized;
    if (!snapshot_locked().SerializeToString(&serialized)) {
        Log::error("DurableAuthStore: failed to serialize snapshot");
        return std::unexpected(RepositoryError::SAVE_FAILED);
    }

    if (serialized.size() > MAX_SNAPSHOT_SIZE) {
        Log::error("DurableAuthStore: snapshot exceeds maximum size ({} bytes > {} bytes)",
                   serialized.size(), MAX_SNAPSHOT_SIZE);
        return std::unexpected(RepositoryError::SAVE_FAILED);
    }

    std::vector<uint8_t> bytes(serialized.begin(), serialized.end());
    if (auto written = StoreIO::write_file(m_path, bytes); !written) {
        Log::error("DurableAuthStore: failed to write {}", m_path.string());
        return std::unexpected(RepositoryError::SAVE_FAILED);
    }
    return {};
}

RepositoryResult<> DurableAuthStore::persist_audit_locked(const authkeep::AuditLogEntry& entry) {
    std::string serialized;
    if (!entry.SerializeToString(&serialized) || serialized.size() > MAX_AUDIT_RECORD_SIZE) {
        Log::error("DurableAuthStore: cannot serialize audit entry {}", entry.event_type());
        return std::unexpected(RepositoryError::SAVE_FAILED);
    }

    std::vector<uint8_t> record;
    record.reserve(AUDIT_LENGTH_PREFIX + serialized.size());
    const auto length = static_cast<uint32_t>(serialized.size());
    record.push_back(static_cast<uint8_t>(length >> 24));
    record.push_back(static_cast<uint8_t>(length >> 16));
    record.push_back(static_cast<uint8_t>(length >> 8));
    record.push_back(static_cast<uint8_t>(length));
    record.insert(record.end(), serialized.begin(), serialized.end());

    if (m_audit_file_size > 0 && m_audit_file_size + record.size() > m_max_audit_file_size) {
        const std::filesystem::path rotated = m_audit_path.string() + ".1";
        std::error_code ec;
        std::filesystem::rename(m_audit_path, rotated, ec);
        if (ec) {
            Log::error("DurableAuthStore: failed to rotate {} ({})",
                       m_audit_path.string(), ec.message());
            return std::unexpected(RepositoryError::SAVE_FAILED);
        }
        Log::info("DurableAuthStore: rotated audit log to {}", rotated.string());
        m_audit_file_size = 0;
    }

    auto appended = StoreIO::append_file(m_audit_path, record);
    if (!appended) {
        Log::error("DurableAuthStore: failed to append to {}", m_audit_path.string());
        return std::unexpected(RepositoryError::SAVE_FAILED);
    }
    m_audit_file_size = *appended;
    return {};
}

} // namespace AuthKeep
