#include "hubxfer/reporter.hpp"
#include "hubxfer/log.hpp"
#include <format>

namespace hubxfer {

namespace {

std::string_view error_label(TransferError error) {
    switch (error) {
        case TransferError::Authentication: return "Authentication Error";
        case TransferError::PermissionDenied: return "Permission Denied";
        case TransferError::NotFound: return "Not Found";
        case TransferError::AlreadyExists: return "Already Exists";
        case TransferError::DependencyMissing: return "Missing Dependency";
        default: return "Error";
    }
}

} // namespace

std::string format_file_size(size_t size_bytes) {
    if (size_bytes < 1024) return std::format("{} B", size_bytes);
    if (size_bytes < 1024 * 1024) return std::format("{:.1f} KB", size_bytes / 1024.0);
    return std::format("{:.1f} MB", size_bytes / (1024.0 * 1024.0));
}

std::unique_ptr<Reporter> Reporter::make(OutputMode mode, bool verbose) {
    if (mode == OutputMode::Json) return std::make_unique<JsonReporter>();
    return std::make_unique<TextReporter>(verbose);
}

std::string TextReporter::event_line(const ProgressEvent& event) {
    switch (event.kind) {
        case EventKind::Milestone:
            return event.message;
        case EventKind::FileStarted:
            return std::format("  📄 {} ({})", event.path, format_file_size(event.size_bytes));
        case EventKind::FileUploaded:
            return std::format("  ✓ {}", event.path);
        case EventKind::FileFailed:
            return std::format("  ⚠️  Failed: {} - {}", event.path, event.message);
        case EventKind::FileSkipped:
            return std::format("  ⏭  Skipped: {}", event.path);
        case EventKind::FileRetry:
            return std::format("  ↻ Retrying {} (attempt {}): {}", event.path, event.attempt, event.message);
    }
    return event.message;
}

void TextReporter::on_event(const ProgressEvent& event) {
    if (!verbose_) return;
    log::info("{}", event_line(event));
}

std::string TextReporter::summary_line(const TransferSession& session, const TransferOutcome& outcome) {
    std::string dest = session.dest.ref.id();
    if (outcome.aborted()) {
        return std::format("Transfer aborted: {} - {} ({} files uploaded, {} failed)",
                           *outcome.abort_reason, dest, outcome.files_uploaded, outcome.files_failed);
    }
    if (outcome.files_failed > 0) {
        return std::format("Transfer completed with {} failures - {} ({} files uploaded)",
                           outcome.files_failed, dest, outcome.files_uploaded);
    }
    return std::format("Successfully transferred {} ({} files)", dest, outcome.files_uploaded);
}

void TextReporter::report(const TransferSession& session, const TransferOutcome& outcome) {
    log::Writer::print(summary_line(session, outcome) + "\n");
    for (const auto& f : outcome.failed_files) {
        log::Writer::print(std::format("  {}: {}\n", f.path, f.reason));
    }
}

std::string TextReporter::error_text(const TransferErrorInfo& error) {
    std::string text = std::format("{}: {}", error_label(error.error), error.message);
    auto hint = remediation_hint(error.error);
    if (!hint.empty()) text += std::format("\nHint: {}", hint);
    return text;
}

void TextReporter::report_error(const TransferErrorInfo& error) {
    log::Writer::error(error_text(error) + "\n");
}

json::Value JsonReporter::outcome_document(const TransferSession& session, const TransferOutcome& outcome) {
    json::Array failed;
    for (const auto& f : outcome.failed_files) {
        failed.push_back(json::Object{{"path", f.path}, {"reason", f.reason}});
    }
    return json::Object{
        {"source_repo", session.source.ref.id()},
        {"dest_repo", session.dest.ref.id()},
        {"repo_type", to_string(outcome.repo_kind)},
        {"files_uploaded", outcome.files_uploaded},
        {"files_skipped", outcome.files_skipped},
        {"files_failed", outcome.files_failed},
        {"source_endpoint", session.source.endpoint.display_name()},
        {"target_endpoint", session.dest.endpoint.display_name()},
        {"failed_files", std::move(failed)}
    };
}

json::Value JsonReporter::error_document(const TransferErrorInfo& error) {
    return json::Object{
        {"error", error.message},
        {"type", type_name(error.error)},
        {"status_code", error.status_code ? json::Value(*error.status_code) : json::Value()}
    };
}

void JsonReporter::report(const TransferSession& session, const TransferOutcome& outcome) {
    log::Writer::print(outcome_document(session, outcome).dump(2) + "\n");
}

void JsonReporter::report_error(const TransferErrorInfo& error) {
    log::Writer::print(error_document(error).dump(2) + "\n");
}

} // namespace hubxfer
