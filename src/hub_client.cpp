#include "hubxfer/hub_client.hpp"
#include "hubxfer/json.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <format>

namespace hubxfer {

namespace {

constexpr std::string_view kLfsContentType = "application/vnd.git-lfs+json";
constexpr size_t kMaxTreePages = 10000;

const std::map<std::string, std::string>& lfs_headers() {
    static const std::map<std::string, std::string> headers{{"Accept", std::string(kLfsContentType)}};
    return headers;
}

std::string encoded_id(const RepoRef& ref) {
    if (ref.owner.empty()) return url_encode(ref.name);
    return std::format("{}/{}", url_encode(ref.owner), url_encode(ref.name));
}

std::map<std::string, std::string> string_fields(const json::Value& obj) {
    std::map<std::string, std::string> out;
    if (!obj.is_object()) return out;
    for (const auto& [k, v] : obj.as_object()) {
        if (v.is_string()) out[k] = v.as_string();
    }
    return out;
}

// Sizes must be non-negative whole numbers
std::optional<size_t> size_field(const json::Value& v) {
    if (!v.is_number()) return std::nullopt;
    double d = v.as_number();
    if (d < 0 || d >= 18446744073709551616.0 || d != std::trunc(d)) return std::nullopt;
    return static_cast<size_t>(d);
}

bool all_digits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

std::string url_encode(std::string_view s, bool keep_slash) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keep_slash && c == '/')) {
            out += static_cast<char>(c);
        } else {
            out += std::format("%{:02X}", c);
        }
    }
    return out;
}

HubErrorInfo from_http_error(const HttpErrorInfo& err, std::string_view what) {
    HubError code = HubError::NetworkError;
    switch (err.error) {
        case HttpError::Timeout: code = HubError::Timeout; break;
        case HttpError::Cancelled: code = HubError::Cancelled; break;
        case HttpError::SinkError: code = HubError::WriteError; break;
        case HttpError::NetworkError:
        case HttpError::ConnectionFailed:
        case HttpError::InvalidUrl:
            break;
    }
    return HubErrorInfo{code, std::format("{}: {}", what, err.message), err.status_code};
}

HttpHubBackend::HttpHubBackend(Endpoint endpoint, const BackendOptions& options)
    : endpoint_(std::move(endpoint)), options_(options) {
    if (endpoint_.auth_token && !endpoint_.auth_token->empty()) {
        http_.set_header("Authorization", std::format("Bearer {}", *endpoint_.auth_token));
    }
    http_.set_header("User-Agent", "hubxfer/1.0");
    http_.set_timeout(options_.timeout_seconds);
    http_.set_stall_timeout(options_.stall_timeout_seconds);
    HttpConfig config;
    config.connect_timeout = options_.connect_timeout_seconds;
    http_.set_config(config);
    http_.set_stop_token(options_.stop_token);
}

std::string_view HttpHubBackend::kind_prefix(RepoKind kind) {
    switch (kind) {
        case RepoKind::Dataset: return "datasets/";
        case RepoKind::Space: return "spaces/";
        default: return "";
    }
}

std::string HttpHubBackend::api_kind(RepoKind kind) {
    // Unknown only reaches here through a caller bug; models are the safe default route
    return std::format("{}s", kind == RepoKind::Unknown ? std::string_view("model") : to_string(kind));
}

std::string HttpHubBackend::info_url(const RepoRef& ref, const std::optional<std::string>& revision) const {
    auto url = std::format("{}/api/{}/{}", endpoint_.base_url, api_kind(ref.kind), encoded_id(ref));
    if (revision && !revision->empty()) url += std::format("/revision/{}", url_encode(*revision));
    return url;
}

std::string HttpHubBackend::tree_url(const RepoRef& ref, const std::string& revision) const {
    return std::format("{}/api/{}/{}/tree/{}?recursive=true",
                       endpoint_.base_url, api_kind(ref.kind), encoded_id(ref), url_encode(revision));
}

std::string HttpHubBackend::commit_url(const RepoRef& ref, const std::string& revision) const {
    return std::format("{}/api/{}/{}/commit/{}",
                       endpoint_.base_url, api_kind(ref.kind), encoded_id(ref), url_encode(revision));
}

std::string HttpHubBackend::lfs_batch_url(const RepoRef& ref) const {
    return std::format("{}/{}{}.git/info/lfs/objects/batch", endpoint_.base_url, kind_prefix(ref.kind), encoded_id(ref));
}

std::string HttpHubBackend::create_url() const {
    return std::format("{}/api/repos/create", endpoint_.base_url);
}

std::string HttpHubBackend::error_message(const HttpResponse& response) {
    if (!response.body.empty()) {
        try {
            auto doc = json::parse(response.body);
            for (const char* key : {"detail", "message", "error"}) {
                const auto& v = doc[key];
                if (v.is_string()) return v.as_string();
                if (!v.is_null()) return v.dump();
            }
        } catch (const json::ParseError&) {
            // Plain-text or HTML error page
        }
        std::string text = response.body.substr(0, 200);
        text.erase(text.find_last_not_of(" \t\r\n") + 1);
        if (!text.empty()) return text;
    }
    return std::format("HTTP {}", response.status_code);
}

HubErrorInfo HttpHubBackend::map_status(const HttpResponse& response, std::string_view what) const {
    HubError code;
    int status = response.status_code;
    if (status == 401) code = HubError::AuthRequired;
    else if (status == 403) code = HubError::PermissionDenied;
    else if (status == 404) code = HubError::NotFound;
    else if (status == 409) code = HubError::AlreadyExists;
    else if (status == 408 || status == 429 || status == 502 || status == 503 || status == 504) code = HubError::NetworkError;
    else if (status >= 500) code = HubError::ServerError;
    else code = HubError::WriteError;
    return HubErrorInfo{code, std::format("{}: {} (HTTP {})", what, error_message(response), status), status};
}

std::string HttpHubBackend::next_page_url(const HttpResponse& response) {
    auto link = response.header("link");
    if (!link) return {};
    std::string_view rest = *link;
    while (!rest.empty()) {
        auto comma = rest.find(',');
        std::string_view part = rest.substr(0, comma);
        rest = comma == std::string_view::npos ? std::string_view{} : rest.substr(comma + 1);
        if (part.find("rel=\"next\"") == std::string_view::npos) continue;
        auto open = part.find('<');
        auto close = part.find('>');
        if (open != std::string_view::npos && close != std::string_view::npos && close > open) {
            return std::string(part.substr(open + 1, close - open - 1));
        }
    }
    return {};
}

std::expected<std::vector<FileEntry>, HubErrorInfo> HttpHubBackend::parse_tree(std::string_view body) {
    try {
        auto doc = json::parse(body);
        if (!doc.is_array()) {
            return std::unexpected(HubErrorInfo{HubError::ParseError, "Tree listing is not an array"});
        }
        std::vector<FileEntry> files;
        for (const auto& item : doc.as_array()) {
            // Directories are implied by file paths
            if (item["type"].string_or("file") != "file" || !item["path"].is_string()) continue;

            FileEntry entry;
            entry.relative_path = item["path"].as_string();
            if (!item["size"].is_null()) {
                auto size = size_field(item["size"]);
                if (!size) return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("Invalid size for {}", entry.relative_path)});
                entry.size_bytes = *size;
            }

            const auto& lfs = item["lfs"];
            if (lfs.is_object()) {
                entry.is_large_object = true;
                if (lfs["oid"].is_string()) entry.content_hash = lfs["oid"].as_string();
                if (!lfs["size"].is_null()) {
                    auto size = size_field(lfs["size"]);
                    if (!size) return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("Invalid LFS size for {}", entry.relative_path)});
                    entry.size_bytes = *size;
                }
            }
            files.push_back(std::move(entry));
        }
        return files;
    } catch (const json::ParseError& e) {
        return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("Failed to parse file tree: {}", e.what())});
    }
}

std::expected<RepoMetadata, HubErrorInfo> HttpHubBackend::parse_info(std::string_view body, RepoKind kind) {
    try {
        auto doc = json::parse(body);
        if (!doc.is_object()) {
            return std::unexpected(HubErrorInfo{HubError::ParseError, "Repository info is not an object"});
        }
        RepoMetadata meta;
        meta.kind = kind;
        meta.repo_id = doc["id"].string_or(doc["repo_id"].string_or(""));
        meta.is_private = doc["private"].is_bool() && doc["private"].as_bool();
        meta.last_commit = doc["sha"].string_or("");
        return meta;
    } catch (const json::ParseError& e) {
        return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("Failed to parse repository info: {}", e.what())});
    }
}

std::expected<RepoMetadata, HubErrorInfo> HttpHubBackend::repo_info(
    const RepoRef& ref,
    const std::optional<std::string>& revision
) {
    auto what = std::format("{} '{}'", to_string(ref.kind), ref.id());
    auto response = http_.get_full(info_url(ref, revision));
    if (!response) return std::unexpected(from_http_error(response.error(), what));
    if (!response->ok()) return std::unexpected(map_status(*response, what));

    auto meta = parse_info(response->body, ref.kind);
    if (meta && meta->repo_id.empty()) meta->repo_id = ref.id();
    return meta;
}

std::expected<std::vector<FileEntry>, HubErrorInfo> HttpHubBackend::list_files(
    const RepoRef& ref,
    const std::string& revision
) {
    auto what = std::format("listing {}@{}", ref.id(), revision);
    std::vector<FileEntry> files;
    std::string url = tree_url(ref, revision);

    for (size_t page = 0; !url.empty(); ++page) {
        if (page >= kMaxTreePages) {
            return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("{}: too many pages", what)});
        }
        auto response = http_.get_full(url);
        if (!response) return std::unexpected(from_http_error(response.error(), what));
        if (!response->ok()) return std::unexpected(map_status(*response, what));

        auto entries = parse_tree(response->body);
        if (!entries) return std::unexpected(entries.error());
        files.insert(files.end(), std::make_move_iterator(entries->begin()), std::make_move_iterator(entries->end()));

        auto next = next_page_url(*response);
        url = (next == url) ? std::string{} : next;
    }
    return files;
}

std::expected<std::unique_ptr<ByteStream>, HubErrorInfo> HttpHubBackend::download(
    const RepoRef& ref,
    const std::string& revision,
    const std::string& path,
    std::string_view expected_sha256
) {
    auto what = std::format("download {}", path);
    auto spool = SpoolFile::create();
    if (!spool) return std::unexpected(HubErrorInfo{HubError::WriteError, spool.error().message});

    SpoolFile& sink = **spool;
    auto response = http_.download(resolve_url(ref, revision, path), [&sink](std::span<const char> chunk) {
        return sink.append(chunk).has_value();
    });
    if (!response) return std::unexpected(from_http_error(response.error(), what));
    if (!response->ok()) return std::unexpected(map_status(*response, what));

    sink.seal();
    if (!expected_sha256.empty() && sink.sha256() != expected_sha256) {
        return std::unexpected(HubErrorInfo{
            HubError::ChecksumMismatch,
            std::format("{}: checksum mismatch (expected {}, got {})", what, expected_sha256, sink.sha256())
        });
    }
    return std::unique_ptr<ByteStream>(std::move(*spool));
}

std::expected<void, HubErrorInfo> HttpHubBackend::upload(
    const RepoRef& ref,
    const std::string& revision,
    const std::string& path,
    ByteStream& content,
    bool is_large_object
) {
    std::string operation;
    if (is_large_object || content.size() >= options_.large_object_threshold_bytes) {
        if (auto r = upload_lfs_object(ref, content); !r) return r;
        json::Value value = json::Object{
            {"path", path},
            {"algo", "sha256"},
            {"oid", content.sha256()},
            {"size", content.size()}
        };
        operation = json::Value(json::Object{{"key", "lfsFile"}, {"value", std::move(value)}}).dump();
    } else {
        if (auto s = content.seek(0); !s) return std::unexpected(HubErrorInfo{HubError::WriteError, s.error().message});
        auto data = read_all(content, options_.large_object_threshold_bytes);
        if (!data) return std::unexpected(HubErrorInfo{HubError::WriteError, data.error().message});
        json::Value value = json::Object{
            {"path", path},
            {"content", base64_encode(*data)},
            {"encoding", "base64"}
        };
        operation = json::Value(json::Object{{"key", "file"}, {"value", std::move(value)}}).dump();
    }
    return commit(ref, revision, path, operation);
}

std::expected<void, HubErrorInfo> HttpHubBackend::commit(
    const RepoRef& ref,
    const std::string& revision,
    const std::string& path,
    const std::string& operation_line
) {
    json::Value header = json::Object{
        {"key", "header"},
        {"value", json::Object{{"summary", std::format("Transfer {}", path)}, {"description", ""}}}
    };
    std::string payload = header.dump() + "\n" + operation_line;

    auto what = std::format("commit {}", path);
    auto response = http_.post(commit_url(ref, revision), payload, "application/x-ndjson");
    if (!response) return std::unexpected(from_http_error(response.error(), what));
    if (!response->ok()) return std::unexpected(map_status(*response, what));
    return {};
}

std::expected<void, HubErrorInfo> HttpHubBackend::upload_lfs_object(const RepoRef& ref, ByteStream& content) {
    auto what = std::format("LFS upload {}", content.sha256());
    json::Value request = json::Object{
        {"operation", "upload"},
        {"transfers", json::Array{"basic", "multipart"}},
        {"objects", json::Array{json::Object{{"oid", content.sha256()}, {"size", content.size()}}}},
        {"hash_algo", "sha256"}
    };
    auto response = http_.post(lfs_batch_url(ref), request.dump(), kLfsContentType, lfs_headers());
    if (!response) return std::unexpected(from_http_error(response.error(), what));
    if (!response->ok()) return std::unexpected(map_status(*response, what));

    try {
        auto doc = json::parse(response->body);
        const auto& objects = doc["objects"];
        if (!objects.is_array() || objects.as_array().empty()) {
            return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("{}: empty batch response", what)});
        }
        const auto& object = objects.as_array().front();
        if (object["error"].is_object()) {
            return std::unexpected(HubErrorInfo{
                HubError::WriteError,
                std::format("{}: {}", what, object["error"]["message"].string_or("rejected by server"))
            });
        }

        const auto& actions = object["actions"];
        const auto& upload_action = actions["upload"];
        if (!upload_action.is_object()) return {}; // object already stored

        std::string href = upload_action["href"].string_or("");
        if (href.empty()) {
            return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("{}: upload action without href", what)});
        }
        auto action_header = string_fields(upload_action["header"]);

        if (auto it = action_header.find("chunk_size"); it != action_header.end()) {
            size_t chunk_size = 0;
            auto [ptr, ec] = std::from_chars(it->second.data(), it->second.data() + it->second.size(), chunk_size);
            if (ec != std::errc() || chunk_size == 0) {
                return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("{}: invalid chunk_size", what)});
            }
            if (auto r = upload_multipart(href, action_header, chunk_size, content); !r) return r;
        } else {
            auto put = http_.put(href, content, 0, content.size(), action_header);
            if (!put) return std::unexpected(from_http_error(put.error(), what));
            if (!put->ok()) return std::unexpected(map_status(*put, what));
        }

        const auto& verify = actions["verify"];
        if (verify.is_object() && verify["href"].is_string()) {
            auto verify_header = string_fields(verify["header"]);
            verify_header["Accept"] = std::string(kLfsContentType);
            json::Value body = json::Object{{"oid", content.sha256()}, {"size", content.size()}};
            auto v = http_.post(verify["href"].as_string(), body.dump(), kLfsContentType, verify_header);
            if (!v) return std::unexpected(from_http_error(v.error(), what));
            if (!v->ok()) return std::unexpected(map_status(*v, what));
        }
        return {};
    } catch (const json::ParseError& e) {
        return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("{}: {}", what, e.what())});
    }
}

std::expected<void, HubErrorInfo> HttpHubBackend::upload_multipart(
    const std::string& completion_url,
    const std::map<std::string, std::string>& action_header,
    size_t chunk_size,
    ByteStream& content
) {
    auto what = std::format("LFS multipart upload {}", content.sha256());

    // Part URLs are the numeric header keys, ordered by part number
    std::vector<std::pair<size_t, std::string>> parts;
    for (const auto& [key, url] : action_header) {
        if (!all_digits(key)) continue;
        size_t number = 0;
        auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), number);
        if (ec != std::errc() || number == 0) {
            return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("{}: invalid part number '{}'", what, key)});
        }
        parts.emplace_back(number, url);
    }
    std::sort(parts.begin(), parts.end());

    size_t needed = (content.size() + chunk_size - 1) / chunk_size;
    if (parts.size() != needed) {
        return std::unexpected(HubErrorInfo{
            HubError::ParseError,
            std::format("{}: server offered {} part URLs for {} parts", what, parts.size(), needed)
        });
    }

    json::Array completed;
    for (size_t i = 0; i < parts.size(); ++i) {
        size_t offset = i * chunk_size;
        size_t length = std::min(chunk_size, content.size() - offset);
        auto put = http_.put(parts[i].second, content, offset, length);
        if (!put) return std::unexpected(from_http_error(put.error(), what));
        if (!put->ok()) return std::unexpected(map_status(*put, what));

        auto etag = put->header("etag");
        if (!etag) {
            return std::unexpected(HubErrorInfo{HubError::ParseError, std::format("{}: part {} returned no ETag", what, i + 1)});
        }
        completed.push_back(json::Object{{"partNumber", i + 1}, {"etag", *etag}});
    }

    json::Value body = json::Object{{"oid", content.sha256()}, {"parts", std::move(completed)}};
    auto response = http_.post(completion_url, body.dump(), kLfsContentType, lfs_headers());
    if (!response) return std::unexpected(from_http_error(response.error(), what));
    if (!response->ok()) return std::unexpected(map_status(*response, what));
    return {};
}

std::expected<void, HubErrorInfo> HttpHubBackend::create(
    const RepoRef& ref,
    RepoKind kind,
    bool is_private
) {
    auto what = std::format("create {} '{}'", to_string(kind), ref.id());
    json::Value body = json::Object{
        {"type", to_string(kind)},
        {"name", ref.name},
        {"organization", ref.owner.empty() ? json::Value() : json::Value(ref.owner)},
        {"private", is_private}
    };
    auto response = http_.post(create_url(), body.dump());
    if (!response) return std::unexpected(from_http_error(response.error(), what));
    if (!response->ok()) return std::unexpected(map_status(*response, what));
    return {};
}

SelfHostedHub::SelfHostedHub(Endpoint endpoint, const BackendOptions& options)
    : HttpHubBackend(std::move(endpoint), options) {}

std::string SelfHostedHub::resolve_url(const RepoRef& ref, const std::string& revision, const std::string& path) const {
    return std::format("{}/{}/{}/resolve/{}/{}",
                       endpoint_.base_url, api_kind(ref.kind), encoded_id(ref), url_encode(revision), url_encode(path, true));
}

HubErrorInfo SelfHostedHub::map_status(const HttpResponse& response, std::string_view what) const {
    auto info = HttpHubBackend::map_status(response, what);
    if (response.status_code == 400) {
        std::string msg = error_message(response);
        std::transform(msg.begin(), msg.end(), msg.begin(), [](unsigned char c) { return std::tolower(c); });
        if (msg.find("exist") != std::string::npos) info.error = HubError::AlreadyExists;
    }
    return info;
}

void register_default_backends(BackendRegistry& registry) {
    registry.add(EndpointKind::SelfHosted, [](const Endpoint& ep, const BackendOptions& options) {
        return std::make_unique<SelfHostedHub>(ep, options);
    });
#ifdef HUBXFER_WITH_REFERENCE_HUB
    registry.add(EndpointKind::ReferenceHub, [](const Endpoint& ep, const BackendOptions& options) {
        return std::make_unique<ReferenceHub>(ep, options);
    });
#endif
}

} // namespace hubxfer
