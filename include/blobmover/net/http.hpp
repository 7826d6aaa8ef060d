#pragma once

#include "blobmover/core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blobmover::net {

enum class HttpMethod {
    GET,
    PUT,
    DELETE,
    HEAD
};

const char* http_method_to_string(HttpMethod method);

bool is_success_status(int status);
bool is_server_error_status(int status);
/// 429 Too Many Requests and 503 Server Busy.
bool is_throttling_status(int status);

/// Header set keyed by lowercase name. A name holds one value; setting it
/// again replaces the previous one. Iteration order is sorted by name.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;

    std::vector<std::pair<std::string, std::string>> all() const;

    void set_content_type(const std::string& content_type);
    void set_content_length(size_t length);

    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    std::map<std::string, std::string> values_;
};

// Inclusive byte range as used by Range / x-ms-range headers
struct ByteRange {
    uint64_t start = 0;
    uint64_t length = 0;

    uint64_t last() const { return start + length - 1; }

    /// "bytes=<start>-<last>"
    std::string to_header() const;

    /// Parse "bytes=a-b". Returns nullopt on malformed input.
    static std::optional<ByteRange> parse(const std::string& header);
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Applies to this request only, never to the whole transfer.
    // Zero uses the transport's request_timeout.
    std::chrono::milliseconds timeout{0};

    static HttpRequest get(const std::string& url);
    static HttpRequest head(const std::string& url);
    static HttpRequest put(const std::string& url, std::vector<uint8_t> body);
    static HttpRequest del(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;

    // Set when no HTTP status was received
    std::string error;
    bool is_network_error = false;
    bool is_timeout = false;
};

/// Black-box request executor. Implementations must be safe to call from
/// several worker threads at once; each call is synchronous.
class Transport {
public:
    virtual ~Transport() = default;

    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

// Request timeout can be overridden via BLOBMOVER_REQUEST_TIMEOUT (seconds).
struct HttpClientConfig {
    // Easy handles kept for reuse once their request finishes
    size_t max_idle_handles = 16;

    std::chrono::milliseconds connect_timeout{constants::DEFAULT_CONNECT_TIMEOUT_MS};
    std::chrono::milliseconds request_timeout{constants::DEFAULT_REQUEST_TIMEOUT_SECONDS * 1000};

    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    std::string user_agent = "blobmover/1.0";
    std::string proxy_url;

    bool verbose = false;
};

/// libcurl-backed transport. Workers borrow an easy handle per request so
/// keep-alive connections survive between chunks.
class CurlTransport : public Transport {
public:
    explicit CurlTransport(const HttpClientConfig& config = {});
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    const HttpClientConfig& config() const;

    struct PoolStats {
        size_t active_handles = 0;
        size_t idle_handles = 0;
        size_t total_requests = 0;
        size_t failed_requests = 0;
    };
    PoolStats pool_stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Percent-encodes everything outside the RFC 3986 unreserved set.
std::string url_encode(const std::string& str);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);
/// Returns an empty vector when the input is not valid base64.
std::vector<uint8_t> base64_decode(const std::string& encoded);

} // namespace blobmover::net
