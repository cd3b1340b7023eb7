#pragma once

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace hubxfer {

class ByteStream;

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers; // keys lowercased
    std::string body;

    std::optional<std::string> header(std::string_view name) const;
    bool ok() const { return status_code >= 200 && status_code < 300; }
};

enum class HttpError {
    NetworkError,
    InvalidUrl,
    Timeout,
    ConnectionFailed,
    Cancelled,
    SinkError
};

struct HttpErrorInfo {
    HttpError error;
    std::string message;
    int status_code = 0;
};

struct HttpConfig {
    size_t buffer_size = 512 * 1024;        // 512KB default
    bool enable_http2 = true;
    bool enable_tcp_nodelay = true;
    bool enable_tcp_keepalive = true;
    long connect_timeout = 30;
};

// Receives body chunks of a streamed GET; returning false aborts the transfer
using BodySink = std::function<bool(std::span<const char>)>;

// One libcurl easy session. Not shared across threads: every transfer worker owns its own.
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    // The returned response carries any HTTP status; only transport failures are errors
    std::expected<HttpResponse, HttpErrorInfo> get_full(std::string_view url);

    std::expected<HttpResponse, HttpErrorInfo> post(
        std::string_view url,
        std::string_view body,
        std::string_view content_type = "application/json",
        const std::map<std::string, std::string>& extra_headers = {}
    );

    // Successful bodies go to sink in buffer-sized chunks; error bodies are kept in the response
    std::expected<HttpResponse, HttpErrorInfo> download(std::string_view url, const BodySink& sink);

    // Streams [offset, offset + length) of body as the request payload. Storage
    // targets are presigned URLs, so only extra_headers are sent.
    std::expected<HttpResponse, HttpErrorInfo> put(
        std::string_view url,
        ByteStream& body,
        size_t offset,
        size_t length,
        const std::map<std::string, std::string>& extra_headers = {}
    );

    void set_header(std::string_view key, std::string_view value);

    // Total time limit per request, in seconds (0 = unlimited)
    void set_timeout(long seconds);
    // Abort when less than 1 byte/s flows for this many seconds (0 = disabled)
    void set_stall_timeout(long seconds);

    void set_config(const HttpConfig& config);
    void set_stop_token(std::stop_token token);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace hubxfer
