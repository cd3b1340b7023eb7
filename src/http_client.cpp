#include "hubxfer/http_client.hpp"
#include "hubxfer/byte_stream.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <format>
#include <mutex>

namespace hubxfer {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

struct DownloadContext {
    CURL* curl;
    const BodySink* sink;
    HttpResponse* response;
    bool sink_failed = false;
};

struct UploadContext {
    ByteStream* stream;
    size_t offset;
    size_t remaining;
    size_t length;
    std::string error;
};

size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* body = static_cast<std::string*>(userp);
    if (body->size() + realsize > body->max_size()) return 0;
    body->append(static_cast<char*>(contents), realsize);
    return realsize;
}

size_t write_sink_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* ctx = static_cast<DownloadContext*>(userp);
    long http_code = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 400) {
        // Error documents are small; keep them for the caller's message
        ctx->response->body.append(static_cast<char*>(contents), realsize);
        return realsize;
    }
    if (!(*ctx->sink)(std::span<const char>(static_cast<char*>(contents), realsize))) {
        ctx->sink_failed = true;
        return 0;
    }
    return realsize;
}

size_t header_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* response = static_cast<HttpResponse*>(userp);
    std::string_view line(contents, realsize);
    if (line.starts_with("HTTP/")) {
        // New response after a redirect or 100-continue
        response->headers.clear();
        return realsize;
    }
    if (auto colon = line.find(':'); colon != std::string_view::npos) {
        auto key = lowercase(line.substr(0, colon));
        std::string value(line.substr(colon + 1));
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        response->headers[key] = value;
    }
    return realsize;
}

size_t read_stream_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<UploadContext*>(userp);
    size_t want = std::min(size * nitems, ctx->remaining);
    if (want == 0) return 0;
    auto n = ctx->stream->read(std::span<char>(buffer, want));
    if (!n) {
        ctx->error = n.error().message;
        return CURL_READFUNC_ABORT;
    }
    ctx->remaining -= *n;
    return *n;
}

int seek_stream_callback(void* userp, curl_off_t offset, int origin) {
    auto* ctx = static_cast<UploadContext*>(userp);
    if (origin != SEEK_SET || offset < 0 || static_cast<size_t>(offset) > ctx->length) return CURL_SEEKFUNC_CANTSEEK;
    if (!ctx->stream->seek(ctx->offset + static_cast<size_t>(offset))) return CURL_SEEKFUNC_FAIL;
    ctx->remaining = ctx->length - static_cast<size_t>(offset);
    return CURL_SEEKFUNC_OK;
}

int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* token = static_cast<std::stop_token*>(clientp);
    return token->stop_requested() ? 1 : 0;
}

HttpErrorInfo map_curl_error(CURLcode res) {
    switch (res) {
        case CURLE_OPERATION_TIMEDOUT:
            return {HttpError::Timeout, curl_easy_strerror(res)};
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
            return {HttpError::ConnectionFailed, curl_easy_strerror(res)};
        case CURLE_ABORTED_BY_CALLBACK:
            return {HttpError::Cancelled, "Transfer cancelled"};
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return {HttpError::InvalidUrl, curl_easy_strerror(res)};
        default:
            return {HttpError::NetworkError, curl_easy_strerror(res)};
    }
}

} // namespace

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    auto it = headers.find(lowercase(name));
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

class HttpClient::Impl {
public:
    std::map<std::string, std::string> headers;
    long timeout = 300;
    long stall_timeout = 0;
    HttpConfig config;
    std::stop_token stop_token;

    Impl() {
        static std::once_flag init_flag;
        std::call_once(init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    HeaderList build_headers(const std::map<std::string, std::string>& extra, bool with_defaults = true) const {
        curl_slist* chunk = nullptr;
        auto append = [&chunk](const std::string& k, const std::string& v) {
            std::string h = k; h += ": "; h += v;
            chunk = curl_slist_append(chunk, h.c_str());
        };
        if (with_defaults) {
            for (const auto& [k, v] : headers) {
                if (!extra.contains(k)) append(k, v);
            }
        }
        for (const auto& [k, v] : extra) append(k, v);
        return HeaderList(chunk, curl_slist_free_all);
    }

    // Options shared by every request kind
    void apply_common(CURL* curl, const std::string& url, curl_slist* header_list, HttpResponse& response) {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, config.connect_timeout);
        if (stall_timeout > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stall_timeout);
        }
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(config.buffer_size));
        if (config.enable_tcp_nodelay) curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
        if (config.enable_tcp_keepalive) curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        if (config.enable_http2 && url.starts_with("https://")) {
            curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
        }
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &stop_token);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    std::expected<HttpResponse, HttpErrorInfo> perform(CURL* curl, HttpResponse& response) {
        if (stop_token.stop_requested()) {
            return std::unexpected(HttpErrorInfo{HttpError::Cancelled, "Transfer cancelled"});
        }
        CURLcode res = curl_easy_perform(curl);
        if (res != CURLE_OK) return std::unexpected(map_curl_error(res));
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<int>(http_code);
        return std::move(response);
    }
};

HttpClient::HttpClient() : pImpl_(std::make_unique<Impl>()) {}
HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

void HttpClient::set_header(std::string_view key, std::string_view value) {
    pImpl_->headers[std::string(key)] = std::string(value);
}

void HttpClient::set_timeout(long seconds) { pImpl_->timeout = seconds; }
void HttpClient::set_stall_timeout(long seconds) { pImpl_->stall_timeout = seconds; }
void HttpClient::set_config(const HttpConfig& config) { pImpl_->config = config; }
void HttpClient::set_stop_token(std::stop_token token) { pImpl_->stop_token = std::move(token); }

std::expected<HttpResponse, HttpErrorInfo> HttpClient::get_full(std::string_view url_sv) {
    std::string url(url_sv);
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) return std::unexpected(HttpErrorInfo{HttpError::NetworkError, "Failed to init CURL"});
    HttpResponse response;
    auto headers = pImpl_->build_headers({});
    pImpl_->apply_common(curl.get(), url, headers.get(), response);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    return pImpl_->perform(curl.get(), response);
}

std::expected<HttpResponse, HttpErrorInfo> HttpClient::post(
    std::string_view url_sv,
    std::string_view body_sv,
    std::string_view content_type,
    const std::map<std::string, std::string>& extra_headers
) {
    std::string url(url_sv);
    std::string body(body_sv);
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) return std::unexpected(HttpErrorInfo{HttpError::NetworkError, "Failed to init CURL"});
    HttpResponse response;
    auto request_headers = extra_headers;
    request_headers["Content-Type"] = std::string(content_type);
    auto headers = pImpl_->build_headers(request_headers);
    pImpl_->apply_common(curl.get(), url, headers.get(), response);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    return pImpl_->perform(curl.get(), response);
}

std::expected<HttpResponse, HttpErrorInfo> HttpClient::download(std::string_view url_sv, const BodySink& sink) {
    std::string url(url_sv);
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) return std::unexpected(HttpErrorInfo{HttpError::NetworkError, "Failed to init CURL"});
    HttpResponse response;
    auto headers = pImpl_->build_headers({});
    pImpl_->apply_common(curl.get(), url, headers.get(), response);
    DownloadContext dctx{curl.get(), &sink, &response};
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_sink_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &dctx);
    auto result = pImpl_->perform(curl.get(), response);
    if (!result && dctx.sink_failed) {
        return std::unexpected(HttpErrorInfo{HttpError::SinkError, "Failed to store downloaded data"});
    }
    return result;
}

std::expected<HttpResponse, HttpErrorInfo> HttpClient::put(
    std::string_view url_sv,
    ByteStream& body,
    size_t offset,
    size_t length,
    const std::map<std::string, std::string>& extra_headers
) {
    std::string url(url_sv);
    if (auto s = body.seek(offset); !s) {
        return std::unexpected(HttpErrorInfo{HttpError::SinkError, s.error().message});
    }
    CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) return std::unexpected(HttpErrorInfo{HttpError::NetworkError, "Failed to init CURL"});
    HttpResponse response;
    auto headers = pImpl_->build_headers(extra_headers, false);
    pImpl_->apply_common(curl.get(), url, headers.get(), response);
    UploadContext uctx{&body, offset, length, length, {}};
    curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(length));
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, read_stream_callback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &uctx);
    curl_easy_setopt(curl.get(), CURLOPT_SEEKFUNCTION, seek_stream_callback);
    curl_easy_setopt(curl.get(), CURLOPT_SEEKDATA, &uctx);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    auto result = pImpl_->perform(curl.get(), response);
    if (!result && !uctx.error.empty()) {
        return std::unexpected(HttpErrorInfo{HttpError::SinkError, uctx.error});
    }
    return result;
}

} // namespace hubxfer
