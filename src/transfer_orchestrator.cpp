#include "hubxfer/transfer_orchestrator.hpp"
#include "hubxfer/auth_resolver.hpp"
#include "hubxfer/log.hpp"
#include "hubxfer/repo_type_detector.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <format>
#include <stdexcept>
#include <thread>

namespace hubxfer {

namespace {

BackendOptions backend_options(const TransferOptions& options, std::stop_token stop) {
    BackendOptions out;
    out.timeout_seconds = options.file_timeout_seconds;
    out.stall_timeout_seconds = options.stall_timeout_seconds;
    out.large_object_threshold_bytes = options.large_object_threshold_bytes;
    out.stop_token = std::move(stop);
    return out;
}

// A refused anonymous read means the repository needs a credential we do not have
TransferErrorInfo source_failure(const HubErrorInfo& err, const Endpoint& endpoint) {
    bool anonymous = !endpoint.auth_token;
    if (anonymous && (err.error == HubError::AuthRequired || err.error == HubError::PermissionDenied)) {
        return TransferErrorInfo{
            TransferError::Authentication,
            std::format("Source repository on {} requires authentication: {}", endpoint.display_name(), err.message),
            err.status_code ? std::optional<int>(err.status_code) : std::nullopt
        };
    }
    return to_transfer_error(err);
}

// Returns false if woken by a stop request
bool interruptible_sleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

std::string failure_reason(const HubErrorInfo& err) {
    return std::format("{}: {}", to_string(err.error), err.message);
}

} // namespace

std::chrono::milliseconds retry_delay(long base_ms, size_t attempt) {
    if (base_ms <= 0) return std::chrono::milliseconds(0);
    long factor = 1L << std::min<size_t>(attempt, 16);
    long delay = base_ms > kMaxRetryDelayMs / factor ? kMaxRetryDelayMs : base_ms * factor;
    return std::chrono::milliseconds(delay);
}

OutcomeAccumulator::OutcomeAccumulator(size_t planned_transfers)
    : recorded_(planned_transfers, false) {}

void OutcomeAccumulator::add_skipped(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    skipped_ += count;
}

size_t OutcomeAccumulator::record_uploaded(size_t index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recorded_.at(index)) return consecutive_failures_;
    recorded_[index] = true;
    ++uploaded_;
    consecutive_failures_ = 0;
    return consecutive_failures_;
}

size_t OutcomeAccumulator::record_failed(size_t index, std::string path, std::string reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recorded_.at(index)) return consecutive_failures_;
    recorded_[index] = true;
    failed_.emplace_back(index, FailedFile{std::move(path), std::move(reason)});
    return ++consecutive_failures_;
}

bool OutcomeAccumulator::is_recorded(size_t index) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return recorded_.at(index);
}

bool OutcomeAccumulator::set_abort(std::string reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (abort_reason_) return false;
    abort_reason_ = std::move(reason);
    return true;
}

std::optional<std::string> OutcomeAccumulator::abort_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return abort_reason_;
}

TransferOutcome OutcomeAccumulator::finalize(RepoKind kind) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finalized_) throw std::logic_error("OutcomeAccumulator finalized twice");
    finalized_ = true;

    std::sort(failed_.begin(), failed_.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

    TransferOutcome outcome;
    outcome.repo_kind = kind;
    outcome.files_uploaded = uploaded_;
    outcome.files_skipped = skipped_;
    outcome.files_failed = failed_.size();
    for (auto& [index, file] : failed_) outcome.failed_files.push_back(std::move(file));
    outcome.abort_reason = abort_reason_;
    return outcome;
}

TransferOrchestrator::TransferOrchestrator(const BackendRegistry& registry, ProgressSink* sink)
    : registry_(registry), sink_(sink) {}

void TransferOrchestrator::emit(ProgressEvent event) const {
    if (sink_) sink_->on_event(event);
}

void TransferOrchestrator::milestone(std::string message) const {
    emit(ProgressEvent{EventKind::Milestone, std::move(message)});
}

std::expected<void, TransferErrorInfo> TransferOrchestrator::validate(const TransferSession& session) const {
    auto invalid = [](std::string message) {
        return std::unexpected(TransferErrorInfo{TransferError::InvalidArgument, std::move(message), std::nullopt});
    };
    const auto& src = session.source;
    const auto& dst = session.dest;

    if (src.ref.name.empty()) return invalid("Source repo_id is empty");
    if (src.ref.owner.empty() && src.endpoint.kind != EndpointKind::ReferenceHub) {
        return invalid("Source repo_id must be in format 'namespace/name'");
    }
    if (dst.ref.owner.empty() || dst.ref.name.empty()) {
        return invalid("Destination repo_id must be in format 'namespace/name'");
    }
    if (src.endpoint.base_url == dst.endpoint.base_url && src.ref.id() == dst.ref.id()) {
        return invalid(std::format("Source and destination are the same repository: {}", dst.ref.id()));
    }
    if (session.options.parallelism == 0) return invalid("Thread count must be at least 1");
    if (session.options.max_retries > kMaxRetries) {
        return invalid(std::format("Retry count must be at most {}", kMaxRetries));
    }
    if (session.options.retry_backoff_ms < 0) return invalid("Retry backoff must not be negative");
    if (session.options.revision.empty() || session.options.dest_revision.empty()) {
        return invalid("Revision must not be empty");
    }
    return {};
}

std::expected<TransferOutcome, TransferErrorInfo> TransferOrchestrator::run(const TransferSession& session) {
    const auto& opts = session.options;
    plan_ = TransferPlan{};

    // Preconditions, no network
    for (const auto* side : {&session.source, &session.dest}) {
        if (!registry_.has(side->endpoint.kind)) {
            auto missing = registry_.create(side->endpoint, BackendOptions{});
            return std::unexpected(missing.error());
        }
    }
    if (auto v = validate(session); !v) return std::unexpected(v.error());
    if (auto t = require_token(session, Side::Target, Access::Write); !t) return std::unexpected(t.error());

    Endpoint source_ep = authenticated_endpoint(session, Side::Source);
    Endpoint dest_ep = authenticated_endpoint(session, Side::Target);

    std::stop_source stop;
    auto control_opts = backend_options(opts, stop.get_token());
    auto source = registry_.create(source_ep, control_opts);
    if (!source) return std::unexpected(source.error());
    auto dest = registry_.create(dest_ep, control_opts);
    if (!dest) return std::unexpected(dest.error());

    milestone(std::format("🔄 Starting transfer from {} to {}", source_ep.base_url, dest_ep.base_url));

    // Type resolution
    if (!opts.repo_type_override) milestone("🔍 Detecting repository type...");
    RepoTypeDetector detector(**source);
    auto kind = detector.detect(session.source.ref, opts.repo_type_override);
    if (!kind) {
        auto err = kind.error();
        if (err.error == TransferError::NotFound) {
            err.message = std::format("Repository '{}' not found on {}", session.source.ref.id(), source_ep.base_url);
        } else if (!source_ep.auth_token && (err.error == TransferError::Authentication || err.error == TransferError::PermissionDenied)) {
            err.error = TransferError::Authentication;
            err.message = std::format("Source repository on {} requires authentication: {}", source_ep.display_name(), err.message);
        }
        return std::unexpected(err);
    }
    if (!opts.repo_type_override) milestone(std::format("✓ Detected as {}", to_string(*kind)));

    RepoRef source_ref = session.source.ref;
    source_ref.kind = *kind;
    RepoRef dest_ref = session.dest.ref;
    dest_ref.kind = *kind;

    // Destination check
    bool needs_create = false;
    if (auto existing = (*dest)->repo_info(dest_ref); existing) {
        if (!opts.force_overwrite) {
            return std::unexpected(TransferErrorInfo{
                TransferError::AlreadyExists,
                std::format("Repository '{}' already exists. Use --force to overwrite.", dest_ref.id()),
                std::nullopt
            });
        }
        milestone("⚠️  Repository exists, overwriting due to --force");
    } else if (existing.error().error == HubError::NotFound) {
        needs_create = true;
    } else {
        return std::unexpected(to_transfer_error(existing.error()));
    }

    // Planning, before the destination is touched
    milestone(std::format("📋 Getting file list from {}...", source_ref.id()));
    auto entries = (*source)->list_files(source_ref, opts.revision);
    if (!entries) return std::unexpected(source_failure(entries.error(), source_ep));
    plan_ = build_plan(*entries, opts);
    log::debug("Plan: {} to transfer, {} skipped, {} excluded",
               plan_.transfers.size(), plan_.skipped.size(), plan_.excluded.size());

    if (needs_create) {
        milestone("📝 Creating repository...");
        auto created = (*dest)->create(dest_ref, *kind, opts.private_repo);
        if (!created && !(created.error().error == HubError::AlreadyExists && opts.force_overwrite)) {
            return std::unexpected(to_transfer_error(created.error()));
        }
    }

    // Execution
    OutcomeAccumulator acc(plan_.transfers.size());
    acc.add_skipped(plan_.skipped.size());
    for (const auto& s : plan_.skipped) emit(ProgressEvent{EventKind::FileSkipped, {}, s.relative_path, s.size_bytes});

    milestone(std::format("📤 Uploading {} files...", plan_.transfers.size()));
    size_t total = plan_.transfers.size();
    size_t worker_count = std::min(opts.parallelism, total);
    std::atomic<size_t> next{0};
    {
        std::vector<std::jthread> workers;
        workers.reserve(worker_count);
        for (size_t w = 0; w < worker_count; ++w) {
            workers.emplace_back([&] {
                while (!stop.stop_requested()) {
                    size_t index = next.fetch_add(1);
                    if (index >= total) return;
                    transfer_entry(session, source_ref, dest_ref, index, acc, stop);
                }
            });
        }
    }

    // Whatever was queued or interrupted when the session aborted
    if (auto reason = acc.abort_reason()) {
        for (size_t i = 0; i < total; ++i) {
            if (!acc.is_recorded(i)) {
                acc.record_failed(i, plan_.transfers[i].relative_path, std::format("cancelled: {}", *reason));
            }
        }
    }

    return acc.finalize(*kind);
}

void TransferOrchestrator::transfer_entry(
    const TransferSession& session,
    const RepoRef& source,
    const RepoRef& dest,
    size_t index,
    OutcomeAccumulator& acc,
    std::stop_source& stop
) const {
    const auto& opts = session.options;
    const FileEntry& entry = plan_.transfers[index];
    emit(ProgressEvent{EventKind::FileStarted, {}, entry.relative_path, entry.size_bytes});

    auto abort = [&](std::string reason) {
        if (acc.set_abort(reason)) log::debug("Aborting transfer: {}", reason);
        stop.request_stop();
    };

    for (size_t attempt = 0;; ++attempt) {
        auto copied = copy_file(session, source, dest, entry, stop.get_token());
        if (copied) {
            acc.record_uploaded(index);
            emit(ProgressEvent{EventKind::FileUploaded, {}, entry.relative_path, entry.size_bytes});
            return;
        }

        const auto& failure = copied.error();
        // Interrupted by someone else's abort; swept up as cancelled afterwards
        if (stop.stop_requested() && failure.error.error == HubError::Cancelled) return;

        bool dest_gone = failure.on_upload && failure.error.error == HubError::NotFound;
        bool dest_refused = failure.on_upload
            && (failure.error.error == HubError::AuthRequired || failure.error.error == HubError::PermissionDenied);

        if (!dest_gone && !dest_refused && is_transient(failure.error.error) && attempt < opts.max_retries) {
            emit(ProgressEvent{EventKind::FileRetry, failure.error.message, entry.relative_path, entry.size_bytes, attempt + 1});
            if (!interruptible_sleep(retry_delay(opts.retry_backoff_ms, attempt), stop.get_token())) return;
            continue;
        }

        std::string reason = failure_reason(failure.error);
        size_t streak = acc.record_failed(index, entry.relative_path, reason);
        emit(ProgressEvent{EventKind::FileFailed, reason, entry.relative_path, entry.size_bytes});

        if (dest_refused) {
            abort(std::format("destination refused credentials: {}", failure.error.message));
        } else if (dest_gone) {
            abort(std::format("destination repository disappeared: {}", failure.error.message));
        } else if (opts.max_consecutive_failures > 0 && streak >= opts.max_consecutive_failures) {
            abort(std::format("{} consecutive file failures", streak));
        }
        return;
    }
}

std::expected<void, TransferOrchestrator::FileFailure> TransferOrchestrator::copy_file(
    const TransferSession& session,
    const RepoRef& source,
    const RepoRef& dest,
    const FileEntry& entry,
    std::stop_token stop
) const {
    auto backend_opts = backend_options(session.options, stop);
    auto setup_failure = [](const TransferErrorInfo& err) {
        return std::unexpected(FileFailure{HubErrorInfo{HubError::NetworkError, err.message}, false});
    };

    // Fresh adapters per file: workers never share connections
    auto src = registry_.create(authenticated_endpoint(session, Side::Source), backend_opts);
    if (!src) return setup_failure(src.error());
    auto dst = registry_.create(authenticated_endpoint(session, Side::Target), backend_opts);
    if (!dst) return setup_failure(dst.error());

    auto content = (*src)->download(source, session.options.revision, entry.relative_path, entry.content_hash);
    if (!content) return std::unexpected(FileFailure{content.error(), false});

    auto uploaded = (*dst)->upload(dest, session.options.dest_revision, entry.relative_path, **content, entry.is_large_object);
    if (!uploaded) return std::unexpected(FileFailure{uploaded.error(), true});
    return {};
}

} // namespace hubxfer
