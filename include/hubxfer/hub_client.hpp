#pragma once

#include "http_client.hpp"
#include "hub_backend.hpp"
#include <map>
#include <string>
#include <string_view>

namespace hubxfer {

// HF-compatible REST implementation shared by every HTTP hub adapter.
// Subclasses differ in download URL layout and error status quirks.
class HttpHubBackend : public HubBackend {
public:
    HttpHubBackend(Endpoint endpoint, const BackendOptions& options);

    std::expected<RepoMetadata, HubErrorInfo> repo_info(
        const RepoRef& ref,
        const std::optional<std::string>& revision = std::nullopt
    ) override;

    std::expected<std::vector<FileEntry>, HubErrorInfo> list_files(
        const RepoRef& ref,
        const std::string& revision
    ) override;

    std::expected<std::unique_ptr<ByteStream>, HubErrorInfo> download(
        const RepoRef& ref,
        const std::string& revision,
        const std::string& path,
        std::string_view expected_sha256 = {}
    ) override;

    std::expected<void, HubErrorInfo> upload(
        const RepoRef& ref,
        const std::string& revision,
        const std::string& path,
        ByteStream& content,
        bool is_large_object
    ) override;

    std::expected<void, HubErrorInfo> create(
        const RepoRef& ref,
        RepoKind kind,
        bool is_private
    ) override;

    std::string info_url(const RepoRef& ref, const std::optional<std::string>& revision) const;
    std::string tree_url(const RepoRef& ref, const std::string& revision) const;
    virtual std::string resolve_url(const RepoRef& ref, const std::string& revision, const std::string& path) const = 0;
    std::string commit_url(const RepoRef& ref, const std::string& revision) const;
    std::string lfs_batch_url(const RepoRef& ref) const;
    std::string create_url() const;

    virtual HubErrorInfo map_status(const HttpResponse& response, std::string_view what) const;

    static std::expected<std::vector<FileEntry>, HubErrorInfo> parse_tree(std::string_view body);
    static std::expected<RepoMetadata, HubErrorInfo> parse_info(std::string_view body, RepoKind kind);
    // Target of a Link: <...>; rel="next" header, empty when this was the last page
    static std::string next_page_url(const HttpResponse& response);
    static std::string error_message(const HttpResponse& response);

protected:
    Endpoint endpoint_;
    BackendOptions options_;
    HttpClient http_;

    // URL segment in front of a repo id for git-level routes
    static std::string_view kind_prefix(RepoKind kind);
    static std::string api_kind(RepoKind kind);

private:
    std::expected<void, HubErrorInfo> commit(
        const RepoRef& ref,
        const std::string& revision,
        const std::string& path,
        const std::string& operation_line
    );

    std::expected<void, HubErrorInfo> upload_lfs_object(const RepoRef& ref, ByteStream& content);
    std::expected<void, HubErrorInfo> upload_multipart(
        const std::string& completion_url,
        const std::map<std::string, std::string>& action_header,
        size_t chunk_size,
        ByteStream& content
    );
};

// Self-hosted hub: every repo kind lives under /{kind}s/ for downloads;
// "already exists" comes back as a 400 with a message.
class SelfHostedHub : public HttpHubBackend {
public:
    SelfHostedHub(Endpoint endpoint, const BackendOptions& options);

    std::string resolve_url(const RepoRef& ref, const std::string& revision, const std::string& path) const override;
    HubErrorInfo map_status(const HttpResponse& response, std::string_view what) const override;
};

// Public reference hub: models sit at the root for downloads, and a missing
// repo is reported as 401 with X-Error-Code: RepoNotFound.
class ReferenceHub : public HttpHubBackend {
public:
    ReferenceHub(Endpoint endpoint, const BackendOptions& options);

    std::string resolve_url(const RepoRef& ref, const std::string& revision, const std::string& path) const override;
    HubErrorInfo map_status(const HttpResponse& response, std::string_view what) const override;
};

HubErrorInfo from_http_error(const HttpErrorInfo& err, std::string_view what);

// Percent-encodes everything but unreserved characters; keeps '/' when keep_slash
std::string url_encode(std::string_view s, bool keep_slash = false);

// Registers the adapters compiled into this build
void register_default_backends(BackendRegistry& registry);

} // namespace hubxfer
