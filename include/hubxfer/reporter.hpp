#pragma once

#include "errors.hpp"
#include "json.hpp"
#include "types.hpp"
#include <memory>
#include <string>

namespace hubxfer {

enum class EventKind {
    Milestone,
    FileStarted,
    FileUploaded,
    FileFailed,
    FileSkipped,
    FileRetry
};

struct ProgressEvent {
    EventKind kind;
    std::string message; // milestone text or failure reason
    std::string path;
    size_t size_bytes = 0;
    size_t attempt = 0;
};

// Receives orchestrator events from any worker thread
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_event(const ProgressEvent& event) = 0;
};

class Reporter : public ProgressSink {
public:
    virtual void report(const TransferSession& session, const TransferOutcome& outcome) = 0;
    virtual void report_error(const TransferErrorInfo& error) = 0;

    static std::unique_ptr<Reporter> make(OutputMode mode, bool verbose);
};

class TextReporter : public Reporter {
public:
    explicit TextReporter(bool verbose) : verbose_(verbose) {}

    void on_event(const ProgressEvent& event) override;
    void report(const TransferSession& session, const TransferOutcome& outcome) override;
    void report_error(const TransferErrorInfo& error) override;

    static std::string summary_line(const TransferSession& session, const TransferOutcome& outcome);
    static std::string event_line(const ProgressEvent& event);
    static std::string error_text(const TransferErrorInfo& error);

private:
    bool verbose_;
};

// Silent while running; one document at the end
class JsonReporter : public Reporter {
public:
    void on_event(const ProgressEvent&) override {}
    void report(const TransferSession& session, const TransferOutcome& outcome) override;
    void report_error(const TransferErrorInfo& error) override;

    static json::Value outcome_document(const TransferSession& session, const TransferOutcome& outcome);
    static json::Value error_document(const TransferErrorInfo& error);
};

std::string format_file_size(size_t size_bytes);

} // namespace hubxfer
