#include "blobmover/net/http.hpp"
#include "blobmover/core/log.hpp"
#include <curl/curl.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <mutex>
#include <span>
#include <string_view>

namespace blobmover::net {

namespace {

std::string lowercase(const std::string& name) {
    std::string out(name);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// BLOBMOVER_REQUEST_TIMEOUT, accepted when it lies in [5, 3600] seconds
std::optional<std::chrono::milliseconds> request_timeout_override() {
    const char* env = std::getenv("BLOBMOVER_REQUEST_TIMEOUT");
    if (!env) return std::nullopt;

    char* end = nullptr;
    unsigned long secs = std::strtoul(env, &end, 10);
    if (end == env || *end != '\0') {
        log_warn("ignoring BLOBMOVER_REQUEST_TIMEOUT=%s: not a number", env);
        return std::nullopt;
    }
    if (secs < 5 || secs > 3600) {
        log_warn("ignoring BLOBMOVER_REQUEST_TIMEOUT=%s: outside [5,3600]", env);
        return std::nullopt;
    }
    return std::chrono::seconds(secs);
}

}  // namespace

const char* http_method_to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::DELETE: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
    }
    return "GET";
}

bool is_success_status(int status) { return status / 100 == 2; }
bool is_server_error_status(int status) { return status / 100 == 5; }
bool is_throttling_status(int status) { return status == 429 || status == 503; }

std::string url_encode(const std::string& str) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        bool unreserved = std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
            continue;
        }
        out.push_back('%');
        out.push_back(hex[c >> 4]);
        out.push_back(hex[c & 0x0F]);
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    if (encoded.empty() || encoded.size() % 4 != 0) return {};

    std::vector<uint8_t> out(encoded.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) return {};

    // EVP_DecodeBlock counts the padding as zero bytes
    size_t padding = 0;
    for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '=' && padding < 2; ++it) {
        ++padding;
    }
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

// --- HttpHeaders ---

void HttpHeaders::set(const std::string& name, const std::string& value) {
    values_[lowercase(name)] = value;
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = values_.find(lowercase(name));
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

bool HttpHeaders::has(const std::string& name) const {
    return values_.count(lowercase(name)) > 0;
}

std::vector<std::pair<std::string, std::string>> HttpHeaders::all() const {
    return {values_.begin(), values_.end()};
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_content_length(size_t length) {
    set("Content-Length", std::to_string(length));
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto raw = get("Content-Length");
    if (!raw || raw->empty()) return std::nullopt;
    char* end = nullptr;
    unsigned long long n = std::strtoull(raw->c_str(), &end, 10);
    if (*end != '\0' || !std::isdigit(static_cast<unsigned char>(raw->front()))) {
        return std::nullopt;
    }
    return n;
}

// --- ByteRange ---

std::string ByteRange::to_header() const {
    return "bytes=" + std::to_string(start) + "-" + std::to_string(last());
}

std::optional<ByteRange> ByteRange::parse(const std::string& header) {
    constexpr std::string_view prefix = "bytes=";
    if (!header.starts_with(prefix)) return std::nullopt;
    auto dash = header.find('-', prefix.size());
    if (dash == std::string::npos) return std::nullopt;
    try {
        uint64_t first = std::stoull(header.substr(prefix.size(), dash - prefix.size()));
        uint64_t last = std::stoull(header.substr(dash + 1));
        if (last < first) return std::nullopt;
        return ByteRange{first, last - first + 1};
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// --- HttpRequest / HttpResponse ---

HttpRequest HttpRequest::get(const std::string& url) {
    return HttpRequest{HttpMethod::GET, url, {}, {}};
}

HttpRequest HttpRequest::head(const std::string& url) {
    return HttpRequest{HttpMethod::HEAD, url, {}, {}};
}

HttpRequest HttpRequest::put(const std::string& url, std::vector<uint8_t> body) {
    return HttpRequest{HttpMethod::PUT, url, {}, std::move(body)};
}

HttpRequest HttpRequest::del(const std::string& url) {
    return HttpRequest{HttpMethod::DELETE, url, {}, {}};
}

std::string HttpResponse::body_string() const {
    return {body.begin(), body.end()};
}

// --- CurlTransport ---

namespace {

// Upload cursor over the request body; curl pulls from it during PUT
struct BodyCursor {
    std::span<const uint8_t> remaining;
};

size_t pull_body(char* dest, size_t size, size_t count, void* userdata) {
    auto* cursor = static_cast<BodyCursor*>(userdata);
    size_t n = std::min(size * count, cursor->remaining.size());
    if (n > 0) {
        std::memcpy(dest, cursor->remaining.data(), n);
    }
    cursor->remaining = cursor->remaining.subspan(n);
    return n;
}

// Response sink; the body is reserved from Content-Length on the first write.
// Callbacks must not throw into libcurl, so allocation failures are parked in
// `failure` and the transfer is aborted by returning 0.
struct ResponseSink {
    HttpResponse* response;
    bool reserved = false;
    std::string failure;
};

size_t push_body(char* src, size_t size, size_t count, void* userdata) {
    auto* sink = static_cast<ResponseSink*>(userdata);
    auto& body = sink->response->body;
    size_t n = size * count;
    try {
        if (!sink->reserved) {
            sink->reserved = true;
            if (auto expected = sink->response->headers.content_length()) {
                body.reserve(static_cast<size_t>(std::min(*expected, constants::MAX_CHUNK_SIZE)));
            }
        }
        body.insert(body.end(), src, src + n);
    } catch (const std::exception& e) {
        sink->failure = e.what();
        return 0;
    }
    return n;
}

size_t push_header(char* line, size_t size, size_t count, void* userdata) {
    auto* sink = static_cast<ResponseSink*>(userdata);
    size_t n = size * count;

    std::string_view text(line, n);
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
        text.remove_suffix(1);
    }
    try {
        // A new status line starts a fresh header block (redirects, 100-continue)
        if (text.starts_with("HTTP/")) {
            sink->response->headers = HttpHeaders{};
            return n;
        }
        auto colon = text.find(':');
        if (colon == std::string_view::npos) return n;

        std::string_view value = text.substr(colon + 1);
        while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
            value.remove_prefix(1);
        }
        sink->response->headers.set(std::string(text.substr(0, colon)), std::string(value));
    } catch (const std::exception& e) {
        sink->failure = e.what();
        return 0;
    }
    return n;
}

// Owns the curl_slist handed to CURLOPT_HTTPHEADER for one request
class HeaderList {
public:
    explicit HeaderList(const HttpHeaders& headers) {
        for (const auto& [name, value] : headers.all()) {
            append(name + ": " + value);
        }
        // Large PUTs would otherwise wait on "Expect: 100-continue"
        append("Expect:");
    }
    ~HeaderList() { curl_slist_free_all(list_); }

    HeaderList(const HeaderList&) = delete;
    HeaderList& operator=(const HeaderList&) = delete;

    curl_slist* get() const { return list_; }

private:
    void append(const std::string& line) {
        if (auto* grown = curl_slist_append(list_, line.c_str())) {
            list_ = grown;
        }
    }

    curl_slist* list_ = nullptr;
};

}  // namespace

class CurlTransport::Impl {
public:
    explicit Impl(const HttpClientConfig& config) : config_(config) {
        static std::once_flag global_init;
        std::call_once(global_init, [] { curl_global_init(CURL_GLOBAL_ALL); });

        if (auto timeout = request_timeout_override()) {
            config_.request_timeout = *timeout;
        }
        if (!config_.verify_ssl) {
            log_warn("TLS certificate verification is disabled");
        }
    }

    ~Impl() {
        for (CURL* handle : idle_) {
            curl_easy_cleanup(handle);
        }
    }

    const HttpClientConfig& config() const { return config_; }

    PoolStats pool_stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;
        Lease lease(*this);
        if (!lease.handle) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }
        CURL* curl = lease.handle;

        HeaderList header_list(request.headers);
        BodyCursor cursor{std::span<const uint8_t>(request.body)};
        ResponseSink sink{&response};

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
        apply_method(curl, request, cursor);

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, push_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, push_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &sink);

        auto timeout = request.timeout.count() > 0 ? request.timeout : config_.request_timeout;
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        apply_connection_options(curl);

        CURLcode rc = curl_easy_perform(curl);
        if (rc != CURLE_OK) {
            response.error = curl_easy_strerror(rc);
            if (!sink.failure.empty()) {
                response.error += ": " + sink.failure;
            }
            response.is_network_error = true;
            response.is_timeout = rc == CURLE_OPERATION_TIMEDOUT;
            log_debug("%s %s: %s", http_method_to_string(request.method),
                      request.url.c_str(), response.error.c_str());
        } else {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status_code = static_cast<int>(status);
        }
        lease.failed = !response.ok();
        return response;
    }

private:
    // Borrows an easy handle for the duration of one request
    struct Lease {
        explicit Lease(Impl& owner) : owner(owner), handle(owner.checkout()) {}
        ~Lease() {
            if (handle) owner.checkin(handle, failed);
        }
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Impl& owner;
        CURL* handle;
        bool failed = true;
    };

    static void apply_method(CURL* curl, const HttpRequest& request, BodyCursor& cursor) {
        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::HEAD:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::DELETE:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(curl, CURLOPT_READFUNCTION, pull_body);
                curl_easy_setopt(curl, CURLOPT_READDATA, &cursor);
                // Sent even for zero-length bodies (commit, empty blob)
                curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
                break;
        }
    }

    void apply_connection_options(CURL* curl) const {
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }
        if (config_.tcp_keepalive) {
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE,
                             static_cast<long>(config_.tcp_keepalive_idle.count()));
            curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL,
                             static_cast<long>(config_.tcp_keepalive_interval.count()));
        }
        long verify = config_.verify_ssl ? 1L : 0L;
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, verify);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, verify * 2);
        if (!config_.ca_bundle_path.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, config_.ca_bundle_path.c_str());
        }
        if (!config_.proxy_url.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());
        }
        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }
    }

    CURL* checkout() {
        std::lock_guard<std::mutex> lock(mutex_);
        CURL* handle = nullptr;
        if (idle_.empty()) {
            handle = curl_easy_init();
        } else {
            handle = idle_.back();
            idle_.pop_back();
        }
        if (handle) ++stats_.active_handles;
        stats_.idle_handles = idle_.size();
        return handle;
    }

    void checkin(CURL* handle, bool failed) {
        // Options are cleared; the connection cache stays with the handle
        curl_easy_reset(handle);

        std::lock_guard<std::mutex> lock(mutex_);
        --stats_.active_handles;
        ++stats_.total_requests;
        if (failed) ++stats_.failed_requests;
        if (idle_.size() < config_.max_idle_handles) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
        stats_.idle_handles = idle_.size();
    }

    HttpClientConfig config_;

    mutable std::mutex mutex_;
    std::vector<CURL*> idle_;
    PoolStats stats_;
};

CurlTransport::CurlTransport(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

CurlTransport::~CurlTransport() = default;

HttpResponse CurlTransport::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& CurlTransport::config() const {
    return impl_->config();
}

CurlTransport::PoolStats CurlTransport::pool_stats() const {
    return impl_->pool_stats();
}

} // namespace blobmover::net
