#include "fake_hub.hpp"
#include "hubxfer/transfer_orchestrator.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

using namespace hubxfer;
using namespace hubxfer::testing;

namespace {

constexpr std::string_view kLocal = "http://localhost:28080";

struct Harness {
    std::shared_ptr<FakeHubState> hf = std::make_shared<FakeHubState>();
    std::shared_ptr<FakeHubState> local = std::make_shared<FakeHubState>();
    BackendRegistry registry;

    Harness() {
        registry.add(EndpointKind::ReferenceHub, fake_factory(hf));
        registry.add(EndpointKind::SelfHosted, fake_factory(local));
    }
};

class RecordingSink : public ProgressSink {
public:
    void on_event(const ProgressEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    size_t count(EventKind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : events_) n += e.kind == kind ? 1 : 0;
        return n;
    }

private:
    std::mutex mutex_;
    std::vector<ProgressEvent> events_;
};

TransferSession make_session(const std::string& src, const std::string& dst) {
    TransferSession s;
    s.source = RepoSide{*RepoRef::parse(src), Endpoint::from_spec("hf")};
    s.dest = RepoSide{*RepoRef::parse(dst), Endpoint::from_spec(kLocal)};
    s.credentials.target_token = "tgt-tok";
    s.options.retry_backoff_ms = 1;
    return s;
}

FakeRepo& seed(Harness& h, const std::string& id, std::initializer_list<std::string> paths) {
    auto& repo = h.hf->add_repo(RepoKind::Model, id);
    for (const auto& p : paths) repo.files.emplace_back(p, std::format("content of {}", p));
    return repo;
}

void check_conservation(const TransferOrchestrator& orch, const TransferOutcome& outcome) {
    assert(outcome.total() == orch.plan().planned());
    assert(outcome.files_failed == outcome.failed_files.size());
}

} // namespace

void test_readme_and_weights_without_large_objects() {
    Harness h;
    auto& repo = h.hf->add_repo(RepoKind::Model, "org/model");
    repo.files.emplace_back("README.md", std::string(2048, 'r'));
    repo.files.emplace_back("weights.bin", "tensor data");
    repo.reported_sizes["weights.bin"] = 500ull * 1024 * 1024;

    auto session = make_session("org/model", "me/model");
    session.options.include_large_objects = false;

    RecordingSink sink;
    TransferOrchestrator orch(h.registry, &sink);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_uploaded == 1);
    assert(outcome->files_skipped == 1);
    assert(outcome->files_failed == 0);
    assert(outcome->repo_kind == RepoKind::Model);
    assert(!outcome->aborted());
    check_conservation(orch, *outcome);

    auto* dest = h.local->find(RepoKind::Model, "me/model");
    assert(dest != nullptr);
    assert(dest->uploaded.size() == 1);
    assert(dest->uploaded.at("README.md") == std::string(2048, 'r'));
    assert(h.hf->count_calls("download weights.bin") == 0);
    assert(sink.count(EventKind::FileSkipped) == 1);
    assert(sink.count(EventKind::FileUploaded) == 1);
    std::cout << "✓ README + weights.bin without large objects: 1 uploaded, 1 skipped\n";
}

void test_large_objects_included_by_default() {
    Harness h;
    auto& repo = seed(h, "org/model", {"config.json", "model.safetensors", "nested/dir/Weights.GGUF"});
    repo.lfs_paths.insert("model.safetensors");

    auto session = make_session("org/model", "me/model");
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_uploaded == 3);
    assert(outcome->files_skipped == 0);
    check_conservation(orch, *outcome);
    assert(orch.plan().transfers[1].is_large_object);
    assert(orch.plan().transfers[2].is_large_object);
    assert(!orch.plan().transfers[0].is_large_object);

    auto* dest = h.local->find(RepoKind::Model, "me/model");
    assert(dest->uploaded.at("nested/dir/Weights.GGUF") == "content of nested/dir/Weights.GGUF");
    std::cout << "✓ Large objects are transferred when included\n";
}

void test_large_extension_only_in_skipped() {
    Harness h;
    seed(h, "org/model", {"a.bin", "b.ONNX", "c.txt", "d.h5", "e.safetensors.txt"});

    auto session = make_session("org/model", "me/model");
    session.options.include_large_objects = false;
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_skipped == 3);
    assert(outcome->files_uploaded == 2);
    for (const auto& t : orch.plan().transfers) {
        assert(!has_large_object_extension(t.relative_path, session.options.large_object_extensions));
    }
    auto* dest = h.local->find(RepoKind::Model, "me/model");
    assert(!dest->uploaded.contains("a.bin"));
    assert(!dest->uploaded.contains("b.ONNX"));
    assert(dest->uploaded.contains("e.safetensors.txt"));
    std::cout << "✓ Large-extension files appear only as skipped\n";
}

void test_unconditional_exclusions_not_counted() {
    Harness h;
    seed(h, "org/model", {".git/config", "__pycache__/x.pyc", ".gitattributes", "a.lock",
                          "README.md", ".hidden/file", "sub/.DS_Store", "node_modules/pkg/index.js"});

    auto session = make_session("org/model", "me/model");
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_uploaded == 2);
    assert(outcome->total() == 2);
    assert(orch.plan().excluded.size() == 6);
    auto* dest = h.local->find(RepoKind::Model, "me/model");
    assert(dest->uploaded.contains(".gitattributes"));
    assert(dest->uploaded.contains("README.md"));
    std::cout << "✓ Hidden, cache, VCS and temp files are excluded and not counted\n";
}

void test_destination_exists_without_force() {
    Harness h;
    seed(h, "org/model", {"README.md", "config.json"});
    h.local->add_repo(RepoKind::Model, "me/model");

    auto session = make_session("org/model", "me/model");
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(!outcome.has_value());
    assert(outcome.error().error == TransferError::AlreadyExists);
    assert(exit_code(outcome.error().error) == 1);
    assert(h.hf->count_calls("download") == 0);
    assert(h.local->count_calls("upload") == 0);
    assert(h.local->count_calls("create") == 0);
    assert(h.hf->count_calls("list_files") == 0);
    std::cout << "✓ Existing destination without --force fails before any file is touched\n";
}

void test_rerun_rejected_then_reproducible_with_force() {
    Harness h;
    seed(h, "org/model", {"README.md", "config.json", "model.bin"});
    auto session = make_session("org/model", "me/model");
    TransferOrchestrator orch(h.registry);

    auto first = orch.run(session);
    assert(first.has_value());
    assert(first->files_uploaded == 3);

    for (int i = 0; i < 2; ++i) {
        auto again = orch.run(session);
        assert(!again.has_value());
        assert(again.error().error == TransferError::AlreadyExists);
    }
    assert(h.local->count_calls("upload") == 3);

    session.options.force_overwrite = true;
    auto forced = orch.run(session);
    assert(forced.has_value());
    assert(forced->files_uploaded == first->files_uploaded);
    assert(h.local->count_calls("create") == 1);
    std::cout << "✓ Re-run rejected without --force, same upload count with --force\n";
}

void test_transient_failures_then_connection_cut() {
    Harness h;
    seed(h, "org/model", {"a.txt", "b.txt", "c.txt"});
    for (int i = 0; i < 3; ++i) {
        h.hf->download_failures["b.txt"].push_back(HubErrorInfo{HubError::NetworkError, "download b.txt: Connection reset by peer"});
    }

    auto session = make_session("org/model", "me/model");
    session.options.max_retries = 2;
    RecordingSink sink;
    TransferOrchestrator orch(h.registry, &sink);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_uploaded == 2);
    assert(outcome->files_failed == 1);
    assert(outcome->failed_files.size() == 1);
    assert(outcome->failed_files[0].path == "b.txt");
    assert(outcome->failed_files[0].reason.find("network") != std::string::npos);
    assert(!outcome->aborted());
    assert(h.hf->count_calls("download b.txt") == 3);
    assert(sink.count(EventKind::FileRetry) == 2);
    check_conservation(orch, *outcome);
    std::cout << "✓ Transient failures retried, then recorded as a network failure\n";
}

void test_transient_failure_recovers() {
    Harness h;
    seed(h, "org/model", {"a.txt"});
    h.local->upload_failures["a.txt"].push_back(HubErrorInfo{HubError::Timeout, "timed out"});

    auto session = make_session("org/model", "me/model");
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_uploaded == 1);
    assert(outcome->files_failed == 0);
    std::cout << "✓ A timeout followed by success counts as uploaded\n";
}

void test_retry_delay_is_bounded() {
    assert(retry_delay(500, 0) == std::chrono::milliseconds(500));
    assert(retry_delay(500, 2) == std::chrono::milliseconds(2000));
    assert(retry_delay(500, 29) == std::chrono::milliseconds(kMaxRetryDelayMs));
    assert(retry_delay(500, 64) == std::chrono::milliseconds(kMaxRetryDelayMs));
    assert(retry_delay(1, 70) <= std::chrono::milliseconds(kMaxRetryDelayMs));
    assert(retry_delay(0, 70) == std::chrono::milliseconds(0));
    std::cout << "✓ Retry delay grows exponentially up to a fixed ceiling\n";
}

void test_many_retries_finish_promptly() {
    Harness h;
    seed(h, "org/model", {"a.txt"});
    for (int i = 0; i < 80; ++i) {
        h.hf->download_failures["a.txt"].push_back(HubErrorInfo{HubError::NetworkError, "Connection reset by peer"});
    }

    auto session = make_session("org/model", "me/model");
    session.options.max_retries = kMaxRetries;
    session.options.retry_backoff_ms = 0;
    TransferOrchestrator orch(h.registry);
    auto start = std::chrono::steady_clock::now();
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_failed == 1);
    assert(h.hf->count_calls("download a.txt") == kMaxRetries + 1);
    assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
    std::cout << "✓ Maximum retry count with zero backoff completes promptly\n";
}

void test_retry_count_above_limit_rejected() {
    Harness h;
    seed(h, "org/model", {"a.txt"});

    auto session = make_session("org/model", "me/model");
    session.options.max_retries = kMaxRetries + 1;
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(!outcome.has_value());
    assert(outcome.error().error == TransferError::InvalidArgument);
    assert(h.hf->count_calls("") == 0);
    std::cout << "✓ Retry count above the limit is rejected before any request\n";
}

void test_checksum_mismatch_not_retried() {
    Harness h;
    seed(h, "org/model", {"a.txt", "b.txt"});
    h.hf->download_failures["b.txt"].push_back(HubErrorInfo{HubError::ChecksumMismatch, "download b.txt: checksum mismatch"});

    auto session = make_session("org/model", "me/model");
    session.options.max_retries = 3;
    RecordingSink sink;
    TransferOrchestrator orch(h.registry, &sink);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_uploaded == 1);
    assert(outcome->files_failed == 1);
    assert(outcome->failed_files[0].path == "b.txt");
    assert(outcome->failed_files[0].reason.starts_with("checksum mismatch"));
    assert(h.hf->count_calls("download b.txt") == 1);
    assert(sink.count(EventKind::FileRetry) == 0);
    std::cout << "✓ Checksum mismatch fails the file without a retry\n";
}

void test_side_specific_tokens_win() {
    Harness h;
    seed(h, "org/model", {"README.md"});
    auto session = make_session("org/model", "me/model");
    session.credentials = TokenCandidates{"src-tok", "tgt-tok", "hf-tok", "fb-tok"};

    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(!h.hf->tokens_seen.empty());
    assert(!h.local->tokens_seen.empty());
    for (const auto& t : h.hf->tokens_seen) assert(t == "src-tok");
    for (const auto& t : h.local->tokens_seen) assert(t == "tgt-tok");
    std::cout << "✓ Side-specific tokens reach the adapters\n";
}

void test_reference_hub_token_only_on_reference_side() {
    Harness h;
    seed(h, "org/model", {"README.md"});
    auto session = make_session("org/model", "me/model");
    session.credentials = TokenCandidates{std::nullopt, std::nullopt, "hf-tok", "fb-tok"};

    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    for (const auto& t : h.hf->tokens_seen) assert(t == "hf-tok");
    for (const auto& t : h.local->tokens_seen) assert(t == "fb-tok");
    std::cout << "✓ --hf-token applies to the reference hub side only\n";
}

void test_dataset_detected_after_model_miss() {
    Harness h;
    auto& repo = h.hf->add_repo(RepoKind::Dataset, "org/data");
    repo.files.emplace_back("train.csv", "a,b\n1,2\n");

    auto session = make_session("org/data", "me/data");
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->repo_kind == RepoKind::Dataset);
    assert(h.hf->calls.size() >= 2);
    assert(h.hf->calls[0] == "repo_info model org/data");
    assert(h.hf->calls[1] == "repo_info dataset org/data");
    assert(h.local->count_calls("create dataset me/data") == 1);
    assert(h.local->find(RepoKind::Dataset, "me/data")->uploaded.contains("train.csv"));
    std::cout << "✓ Model probe miss precedes dataset hit\n";
}

void test_override_skips_detection() {
    Harness h;
    auto& repo = h.hf->add_repo(RepoKind::Space, "org/app");
    repo.files.emplace_back("app.py", "print('hi')\n");

    auto session = make_session("org/app", "me/app");
    session.options.repo_type_override = RepoKind::Space;
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->repo_kind == RepoKind::Space);
    assert(h.hf->count_calls("repo_info") == 0);
    std::cout << "✓ Type override bypasses detection\n";
}

void test_source_not_found() {
    Harness h;
    auto session = make_session("org/missing", "me/missing");
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(!outcome.has_value());
    assert(outcome.error().error == TransferError::NotFound);
    assert(exit_code(outcome.error().error) == 7);
    assert(outcome.error().message.find("org/missing") != std::string::npos);
    assert(h.local->count_calls("create") == 0);
    std::cout << "✓ Missing source fails with NotFound and exit code 7\n";
}

void test_dependency_missing() {
    Harness h;
    BackendRegistry partial;
    partial.add(EndpointKind::SelfHosted, fake_factory(h.local));

    auto session = make_session("org/model", "me/model");
    TransferOrchestrator orch(partial);
    auto outcome = orch.run(session);
    assert(!outcome.has_value());
    assert(outcome.error().error == TransferError::DependencyMissing);
    assert(outcome.error().message.find("upload") != std::string::npos);
    assert(h.local->calls.empty());
    assert(h.local->tokens_seen.empty());
    std::cout << "✓ Missing adapter is reported before any other work\n";
}

void test_write_side_requires_token() {
    Harness h;
    seed(h, "org/model", {"README.md"});
    auto session = make_session("org/model", "me/model");
    session.credentials = TokenCandidates{};

    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(!outcome.has_value());
    assert(outcome.error().error == TransferError::Authentication);
    assert(exit_code(outcome.error().error) == 3);
    assert(h.hf->calls.empty());
    assert(h.local->calls.empty());
    std::cout << "✓ Missing write credential fails before any network call\n";
}

void test_anonymous_source_refused() {
    Harness h;
    seed(h, "org/private", {"README.md"});
    h.hf->require_token_for_reads = true;

    auto session = make_session("org/private", "me/private");
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(!outcome.has_value());
    assert(outcome.error().error == TransferError::Authentication);
    assert(h.local->count_calls("create") == 0);
    std::cout << "✓ Refused anonymous source read is an authentication error\n";
}

void test_invalid_destination_id() {
    Harness h;
    seed(h, "org/model", {"README.md"});
    auto session = make_session("org/model", "model");
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(!outcome.has_value());
    assert(outcome.error().error == TransferError::InvalidArgument);
    assert(h.hf->calls.empty());
    std::cout << "✓ Destination without namespace is rejected\n";
}

void test_abort_when_destination_refuses_credentials() {
    Harness h;
    seed(h, "org/model", {"a.txt", "b.txt", "c.txt", "d.txt"});
    h.local->upload_failures["b.txt"].push_back(HubErrorInfo{HubError::AuthRequired, "Invalid token", 401});

    auto session = make_session("org/model", "me/model");
    session.options.parallelism = 1;
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->aborted());
    assert(outcome->files_uploaded == 1);
    assert(outcome->files_failed == 3);
    assert(outcome->failed_files[0].path == "b.txt");
    assert(outcome->failed_files[1].path == "c.txt");
    assert(outcome->failed_files[2].path == "d.txt");
    assert(outcome->failed_files[1].reason.starts_with("cancelled: "));
    assert(outcome->failed_files[2].reason.starts_with("cancelled: "));
    assert(h.hf->count_calls("download c.txt") == 0);
    check_conservation(orch, *outcome);
    std::cout << "✓ Destination 401 aborts the session and cancels queued files\n";
}

void test_abort_interrupts_in_flight_uploads() {
    Harness h;
    seed(h, "org/model", {"a.txt", "b.txt", "c.txt", "d.txt", "e.txt", "f.txt"});
    h.local->upload_delay = std::chrono::milliseconds(2000);
    h.hf->download_failures["a.txt"].push_back(HubErrorInfo{HubError::ServerError, "boom", 500});

    auto session = make_session("org/model", "me/model");
    session.options.parallelism = 3;
    session.options.max_consecutive_failures = 1;
    TransferOrchestrator orch(h.registry);

    auto started = std::chrono::steady_clock::now();
    auto outcome = orch.run(session);
    auto elapsed = std::chrono::steady_clock::now() - started;

    assert(outcome.has_value());
    assert(outcome->aborted());
    assert(outcome->files_uploaded == 0);
    assert(outcome->files_failed == 6);
    assert(outcome->failed_files[0].path == "a.txt");
    for (size_t i = 1; i < outcome->failed_files.size(); ++i) {
        assert(outcome->failed_files[i].reason.starts_with("cancelled: "));
    }
    assert(elapsed < std::chrono::milliseconds(1500));
    check_conservation(orch, *outcome);
    std::cout << "✓ Abort interrupts in-flight uploads\n";
}

void test_consecutive_failure_escalation() {
    Harness h;
    seed(h, "org/model", {"a.txt", "b.txt", "c.txt", "d.txt", "e.txt"});
    h.hf->download_failures["a.txt"].push_back(HubErrorInfo{HubError::ServerError, "internal", 500});
    h.hf->download_failures["b.txt"].push_back(HubErrorInfo{HubError::ServerError, "internal", 500});

    auto session = make_session("org/model", "me/model");
    session.options.parallelism = 1;
    session.options.max_consecutive_failures = 2;
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->aborted());
    assert(outcome->abort_reason->find("2 consecutive") != std::string::npos);
    assert(outcome->files_uploaded == 0);
    assert(outcome->files_failed == 5);
    check_conservation(orch, *outcome);

    // Disabled policy: the same failures leave the session running
    Harness h2;
    seed(h2, "org/model", {"a.txt", "b.txt", "c.txt", "d.txt", "e.txt"});
    h2.hf->download_failures["a.txt"].push_back(HubErrorInfo{HubError::ServerError, "internal", 500});
    h2.hf->download_failures["b.txt"].push_back(HubErrorInfo{HubError::ServerError, "internal", 500});
    session.options.max_consecutive_failures = 0;
    TransferOrchestrator orch2(h2.registry);
    auto relaxed = orch2.run(session);
    assert(relaxed.has_value());
    assert(!relaxed->aborted());
    assert(relaxed->files_uploaded == 3);
    assert(relaxed->files_failed == 2);
    std::cout << "✓ Consecutive failures escalate only when configured\n";
}

void test_bounded_parallelism() {
    Harness h;
    auto& repo = h.hf->add_repo(RepoKind::Model, "org/model");
    for (int i = 0; i < 16; ++i) repo.files.emplace_back(std::format("shard-{:02}.txt", i), std::format("shard {}", i));
    h.local->upload_delay = std::chrono::milliseconds(5);

    auto session = make_session("org/model", "me/model");
    session.options.parallelism = 4;
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_uploaded == 16);
    assert(h.local->max_active_uploads.load() <= 4);
    assert(h.local->find(RepoKind::Model, "me/model")->uploaded.size() == 16);
    std::cout << "✓ Worker pool never exceeds the configured parallelism\n";
}

void test_failed_files_in_plan_order() {
    Harness h;
    auto& repo = h.hf->add_repo(RepoKind::Model, "org/model");
    for (int i = 0; i < 8; ++i) {
        auto path = std::format("f{}.txt", i);
        repo.files.emplace_back(path, "x");
        if (i % 2 == 1) h.local->upload_failures[path].push_back(HubErrorInfo{HubError::WriteError, "rejected", 422});
    }
    h.local->upload_delay = std::chrono::milliseconds(1);

    auto session = make_session("org/model", "me/model");
    session.options.parallelism = 4;
    TransferOrchestrator orch(h.registry);
    auto outcome = orch.run(session);
    assert(outcome.has_value());
    assert(outcome->files_failed == 4);
    assert(outcome->failed_files[0].path == "f1.txt");
    assert(outcome->failed_files[1].path == "f3.txt");
    assert(outcome->failed_files[2].path == "f5.txt");
    assert(outcome->failed_files[3].path == "f7.txt");
    assert(outcome->failed_files[0].reason == "write rejected: rejected");
    std::cout << "✓ failed_files is sorted by plan order\n";
}

void test_accumulator_records_once() {
    OutcomeAccumulator acc(2);
    acc.add_skipped(1);
    acc.record_failed(1, "b", "first");
    acc.record_failed(1, "b", "second");
    acc.record_uploaded(0);
    acc.record_uploaded(0);
    assert(acc.set_abort("stopped"));
    assert(!acc.set_abort("again"));
    auto outcome = acc.finalize(RepoKind::Model);
    assert(outcome.files_uploaded == 1);
    assert(outcome.files_failed == 1);
    assert(outcome.files_skipped == 1);
    assert(outcome.failed_files[0].reason == "first");
    assert(outcome.abort_reason == "stopped");

    bool threw = false;
    try {
        acc.finalize(RepoKind::Model);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "✓ Accumulator records each file once and finalizes once\n";
}

int main() {
    std::cout << "Testing transfer orchestrator...\n\n";
    test_readme_and_weights_without_large_objects();
    test_large_objects_included_by_default();
    test_large_extension_only_in_skipped();
    test_unconditional_exclusions_not_counted();
    test_destination_exists_without_force();
    test_rerun_rejected_then_reproducible_with_force();
    test_transient_failures_then_connection_cut();
    test_transient_failure_recovers();
    test_retry_delay_is_bounded();
    test_many_retries_finish_promptly();
    test_retry_count_above_limit_rejected();
    test_checksum_mismatch_not_retried();
    test_side_specific_tokens_win();
    test_reference_hub_token_only_on_reference_side();
    test_dataset_detected_after_model_miss();
    test_override_skips_detection();
    test_source_not_found();
    test_dependency_missing();
    test_write_side_requires_token();
    test_anonymous_source_refused();
    test_invalid_destination_id();
    test_abort_when_destination_refuses_credentials();
    test_abort_interrupts_in_flight_uploads();
    test_consecutive_failure_escalation();
    test_bounded_parallelism();
    test_failed_files_in_plan_order();
    test_accumulator_records_once();
    std::cout << "\n✓ All orchestrator tests passed\n";
    return 0;
}
