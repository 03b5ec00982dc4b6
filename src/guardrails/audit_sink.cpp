/// @file audit_sink.cpp
/// @brief Audit sink implementations

#include "guardrails/audit_sink.h"

#include <nlohmann/json.hpp>

#include "common/logging.h"

namespace aegis::guardrails {

// =============================================================================
// LoggingAuditSink
// =============================================================================

LoggingAuditSink::LoggingAuditSink(std::shared_ptr<spdlog::logger> logger)
    : logger_(logger ? std::move(logger) : GetAuditLogger()) {}

absl::Status LoggingAuditSink::Emit(const AuditLogEntry& entry) {
    if (!logger_) {
        return absl::FailedPreconditionError("Audit logger not initialized");
    }

    // Previews can be cut mid-character or carry invalid input bytes
    const std::string line =
        ToJson(entry).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    if (entry.passed) {
        logger_->info("{}", line);
    } else {
        logger_->warn("{}", line);
    }
    return absl::OkStatus();
}

// =============================================================================
// AsyncAuditSink
// =============================================================================

AsyncAuditSink::AsyncAuditSink(std::shared_ptr<AuditSink> inner, size_t max_pending)
    : inner_(std::move(inner)), pool_(1, max_pending) {}

AsyncAuditSink::~AsyncAuditSink() {
    pool_.Shutdown();
}

absl::Status AsyncAuditSink::Emit(const AuditLogEntry& entry) {
    if (!inner_) {
        return absl::FailedPreconditionError("AsyncAuditSink has no destination");
    }

    return pool_.Execute([inner = inner_, entry] {
        auto status = inner->Emit(entry);
        if (!status.ok()) {
            AEGIS_LOG_WARN("Audit sink failed: {}", status.ToString());
        }
    });
}

void AsyncAuditSink::Flush() {
    pool_.Wait();
}

// =============================================================================
// CollectingAuditSink
// =============================================================================

absl::Status CollectingAuditSink::Emit(const AuditLogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
    return absl::OkStatus();
}

std::vector<AuditLogEntry> CollectingAuditSink::Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

size_t CollectingAuditSink::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void CollectingAuditSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

}  // namespace aegis::guardrails
