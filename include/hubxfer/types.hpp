#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hubxfer {

enum class RepoKind {
    Model,
    Dataset,
    Space,
    Unknown
};

enum class EndpointKind {
    SelfHosted,
    ReferenceHub
};

enum class OutputMode {
    Text,
    Json
};

inline constexpr std::string_view kReferenceHubUrl = "https://huggingface.co";

std::string_view to_string(RepoKind kind);
std::optional<RepoKind> parse_repo_kind(std::string_view s);

struct Endpoint {
    std::string base_url;
    std::optional<std::string> auth_token;
    EndpointKind kind = EndpointKind::SelfHosted;

    // "hf" and the reference hub URL map to ReferenceHub; anything else is self-hosted
    static Endpoint from_spec(std::string_view spec);
    std::string display_name() const;
};

struct RepoRef {
    std::string owner; // may be empty for legacy root-level repos on the reference hub
    std::string name;
    RepoKind kind = RepoKind::Unknown;

    std::string id() const {
        return owner.empty() ? name : owner + "/" + name;
    }

    static std::optional<RepoRef> parse(std::string_view repo_id);
};

struct RepoSide {
    RepoRef ref;
    Endpoint endpoint;
};

struct FileEntry {
    std::string relative_path;
    size_t size_bytes = 0;
    std::string content_hash; // sha256 hex, empty if the backend did not report one
    bool is_large_object = false;
};

struct RepoMetadata {
    std::string repo_id;
    RepoKind kind = RepoKind::Unknown;
    bool is_private = false;
    std::string last_commit;
};

// Candidate credentials as given on the command line; resolved per side by auth_resolver
struct TokenCandidates {
    std::optional<std::string> src_token;
    std::optional<std::string> target_token;
    std::optional<std::string> reference_hub_token;
    std::optional<std::string> fallback_token;
};

// Upper bounds for the retry policy
constexpr size_t kMaxRetries = 20;
constexpr long kMaxRetryDelayMs = 30'000;

struct TransferOptions {
    std::optional<RepoKind> repo_type_override;
    bool include_large_objects = true;
    bool force_overwrite = false;
    bool private_repo = false;
    std::string revision = "main";
    std::string dest_revision = "main";
    OutputMode output_mode = OutputMode::Text;
    int verbosity = 0;

    size_t parallelism = 4;
    size_t max_retries = 2;
    long retry_backoff_ms = 500;
    long file_timeout_seconds = 3600;
    long stall_timeout_seconds = 60;
    size_t max_consecutive_failures = 0; // 0 disables escalation

    std::vector<std::string> large_object_extensions{".bin", ".safetensors", ".gguf", ".h5", ".onnx"};
    size_t large_object_threshold_bytes = 10 * 1024 * 1024;
};

struct TransferSession {
    RepoSide source;
    RepoSide dest;
    TokenCandidates credentials;
    TransferOptions options;
};

struct FailedFile {
    std::string path;
    std::string reason;
};

struct TransferOutcome {
    RepoKind repo_kind = RepoKind::Unknown;
    size_t files_uploaded = 0;
    size_t files_skipped = 0;
    size_t files_failed = 0;
    std::vector<FailedFile> failed_files;
    std::optional<std::string> abort_reason;

    size_t total() const { return files_uploaded + files_skipped + files_failed; }
    bool aborted() const { return abort_reason.has_value(); }
};

} // namespace hubxfer
