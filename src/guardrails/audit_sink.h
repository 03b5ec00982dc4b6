#pragma once

/// @file audit_sink.h
/// @brief Destinations for guardrail audit records

#include <memory>
#include <mutex>
#include <vector>

#include <absl/status/status.h>
#include <spdlog/spdlog.h>

#include "common/thread_pool.h"
#include "guardrails/types.h"

namespace aegis::guardrails {

/// @brief Receives one AuditLogEntry per emitted check
///
/// Implementations must be safe to call from multiple threads. A failed
/// Emit() is logged by the caller and never changes a check result.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual absl::Status Emit(const AuditLogEntry& entry) = 0;
};

/// @brief Writes entries as single-line JSON to the audit logger
///
/// Failed checks are written at warn, passed checks at info.
class LoggingAuditSink : public AuditSink {
public:
    /// @param logger Destination; defaults to aegis::GetAuditLogger()
    explicit LoggingAuditSink(std::shared_ptr<spdlog::logger> logger = nullptr);

    absl::Status Emit(const AuditLogEntry& entry) override;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

/// @brief Forwards entries to another sink on a background worker
///
/// Emit() only queues the entry; it fails with ResourceExhausted when
/// max_pending entries are already waiting.
class AsyncAuditSink : public AuditSink {
public:
    explicit AsyncAuditSink(std::shared_ptr<AuditSink> inner, size_t max_pending = 1024);
    ~AsyncAuditSink() override;

    absl::Status Emit(const AuditLogEntry& entry) override;

    /// @brief Block until every queued entry has been forwarded
    void Flush();

    uint64_t DroppedEntries() const { return pool_.DroppedTasks(); }

private:
    std::shared_ptr<AuditSink> inner_;
    ThreadPool pool_;
};

/// @brief Keeps entries in memory
class CollectingAuditSink : public AuditSink {
public:
    absl::Status Emit(const AuditLogEntry& entry) override;

    std::vector<AuditLogEntry> Entries() const;
    size_t Size() const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::vector<AuditLogEntry> entries_;
};

}  // namespace aegis::guardrails
