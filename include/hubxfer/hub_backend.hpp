#pragma once

#include "byte_stream.hpp"
#include "errors.hpp"
#include "types.hpp"
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace hubxfer {

// Capabilities a hub must offer to take part in a transfer
class HubBackend {
public:
    virtual ~HubBackend() = default;

    virtual std::expected<RepoMetadata, HubErrorInfo> repo_info(
        const RepoRef& ref,
        const std::optional<std::string>& revision = std::nullopt
    ) = 0;

    // Files only, in the order the hub lists them
    virtual std::expected<std::vector<FileEntry>, HubErrorInfo> list_files(
        const RepoRef& ref,
        const std::string& revision
    ) = 0;

    // Content is spooled, never held in memory whole; a non-empty expected_sha256 is verified
    virtual std::expected<std::unique_ptr<ByteStream>, HubErrorInfo> download(
        const RepoRef& ref,
        const std::string& revision,
        const std::string& path,
        std::string_view expected_sha256 = {}
    ) = 0;

    virtual std::expected<void, HubErrorInfo> upload(
        const RepoRef& ref,
        const std::string& revision,
        const std::string& path,
        ByteStream& content,
        bool is_large_object
    ) = 0;

    virtual std::expected<void, HubErrorInfo> create(
        const RepoRef& ref,
        RepoKind kind,
        bool is_private
    ) = 0;
};

// Per-connection settings handed to a backend when it is created
struct BackendOptions {
    long timeout_seconds = 3600;
    long stall_timeout_seconds = 60;
    long connect_timeout_seconds = 30;
    size_t large_object_threshold_bytes = 10 * 1024 * 1024;
    std::stop_token stop_token;
};

using BackendFactory = std::function<std::unique_ptr<HubBackend>(const Endpoint&, const BackendOptions&)>;

// Maps endpoint kinds to adapter factories. Each call to create() yields a
// fresh backend with its own connection.
class BackendRegistry {
public:
    void add(EndpointKind kind, BackendFactory factory);
    bool has(EndpointKind kind) const;

    std::expected<std::unique_ptr<HubBackend>, TransferErrorInfo> create(
        const Endpoint& endpoint,
        const BackendOptions& options
    ) const;

private:
    std::map<EndpointKind, BackendFactory> factories_;
};

std::string_view to_string(EndpointKind kind);

} // namespace hubxfer
