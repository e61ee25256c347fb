// SPDX-License-Identifier: GPL-3.0-or-later
// SPDX-FileCopyrightText: 2026 tjdeveng

#include "IAuditSink.h"
#include "../../utils/Log.h"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace AuthKeep {

void LogAuditSink::append(const authkeep::AuditLogEntry& entry) noexcept {
    try {
        // Protobuf maps have unspecified order; sort for stable log lines
        std::map<std::string, std::string> sorted;
        for (const auto& kv : entry.details()) {
            sorted.emplace(kv.first, kv.second);
        }
        std::string details;
        for (const auto& [key, value] : sorted) {
            if (!details.empty()) {
                details += ' ';
            }
            details += key;
            details += '=';
            details += value;
        }
        Log::info("AUDIT {} subject={} {}", entry.event_type(), entry.subject_hash(), details);
    } catch (const std::exception& e) {
        Log::error("LogAuditSink: failed to format entry {}: {}", entry.event_type(), e.what());
    }
}

FanoutAuditSink::FanoutAuditSink(std::vector<IAuditSink*> sinks)
    : m_sinks(std::move(sinks)) {
    if (std::any_of(m_sinks.begin(), m_sinks.end(), [](IAuditSink* s) { return s == nullptr; })) {
        throw std::invalid_argument("FanoutAuditSink: sink cannot be null");
    }
}

void FanoutAuditSink::append(const authkeep::AuditLogEntry& entry) noexcept {
    for (IAuditSink* sink : m_sinks) {
        sink->append(entry);
    }
}

} // namespace AuthKeep
