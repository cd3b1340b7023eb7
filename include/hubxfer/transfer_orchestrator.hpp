#pragma once

#include "errors.hpp"
#include "file_filter.hpp"
#include "hub_backend.hpp"
#include "reporter.hpp"
#include "types.hpp"
#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace hubxfer {

// Single serialisation point for per-file results. Indices are plan positions.
class OutcomeAccumulator {
public:
    explicit OutcomeAccumulator(size_t planned_transfers);

    void add_skipped(size_t count);
    // Both return the current run of consecutive failures
    size_t record_uploaded(size_t index);
    size_t record_failed(size_t index, std::string path, std::string reason);

    bool is_recorded(size_t index) const;

    // First reason wins; returns false if the session was already aborted
    bool set_abort(std::string reason);
    std::optional<std::string> abort_reason() const;

    // Sorts failures by plan order; may be called once
    TransferOutcome finalize(RepoKind kind);

private:
    mutable std::mutex mutex_;
    std::vector<bool> recorded_;
    std::vector<std::pair<size_t, FailedFile>> failed_;
    size_t uploaded_ = 0;
    size_t skipped_ = 0;
    size_t consecutive_failures_ = 0;
    std::optional<std::string> abort_reason_;
    bool finalized_ = false;
};

// Exponential backoff before retry number attempt + 1, capped at kMaxRetryDelayMs
std::chrono::milliseconds retry_delay(long base_ms, size_t attempt);

class TransferOrchestrator {
public:
    // The sink may be null
    TransferOrchestrator(const BackendRegistry& registry, ProgressSink* sink = nullptr);

    // Session-fatal problems before execution are errors; per-file problems
    // and mid-run aborts end up in the outcome.
    std::expected<TransferOutcome, TransferErrorInfo> run(const TransferSession& session);

    // Plan of the last run, for callers that want to inspect it
    const TransferPlan& plan() const { return plan_; }

private:
    struct FileFailure {
        HubErrorInfo error;
        bool on_upload;
    };

    const BackendRegistry& registry_;
    ProgressSink* sink_;
    TransferPlan plan_;

    std::expected<void, TransferErrorInfo> validate(const TransferSession& session) const;
    std::expected<void, FileFailure> copy_file(
        const TransferSession& session,
        const RepoRef& source,
        const RepoRef& dest,
        const FileEntry& entry,
        std::stop_token stop
    ) const;
    void transfer_entry(
        const TransferSession& session,
        const RepoRef& source,
        const RepoRef& dest,
        size_t index,
        OutcomeAccumulator& acc,
        std::stop_source& stop
    ) const;

    void emit(ProgressEvent event) const;
    void milestone(std::string message) const;
};

} // namespace hubxfer
