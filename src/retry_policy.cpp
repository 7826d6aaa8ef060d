#include "blobmover/transfer/retry_policy.hpp"

#include <algorithm>
#include <cctype>

namespace blobmover {

namespace {

bool contains_ci(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

bool is_signature_expiry(const net::HttpResponse& response) {
    if (response.status_code != 403) return false;
    auto code = response.headers.get("x-ms-error-code").value_or("");
    if (code != "AuthenticationFailed") return false;
    return contains_ci(response.body_string(), "expire");
}

}  // namespace

RetryPolicy::RetryPolicy(RetryOptions options, std::optional<uint64_t> seed)
    : options_(std::move(options))
    , rng_(seed ? *seed : std::random_device{}()) {}

bool RetryPolicy::is_transient(ErrorKind kind, bool chunk_scope) {
    switch (kind) {
        case ErrorKind::TransientTransport:
            return true;
        case ErrorKind::Integrity:
            return chunk_scope;
        default:
            return false;
    }
}

std::chrono::milliseconds RetryPolicy::backoff(uint32_t attempt) const {
    if (attempt == 0) attempt = 1;
    // Cap the shift well before overflow; max_wait bounds the result anyway
    uint32_t shift = std::min<uint32_t>(attempt - 1, 30);
    auto base = options_.base_wait.count();
    auto cap = options_.max_wait.count();
    if (base <= 0) return std::chrono::milliseconds(0);
    if (base > (cap >> shift)) return options_.max_wait;
    return std::chrono::milliseconds(std::min<int64_t>(cap, base << shift));
}

RetryDecision RetryPolicy::should_retry(RetryContext& context) const {
    if (!is_transient(context.last_error, context.chunk_index.has_value())) {
        return RetryDecision::stop();
    }
    if (context.attempt >= options_.max_attempts) {
        return RetryDecision::stop();
    }

    auto wait = backoff(context.attempt);
    if (options_.jitter_fraction > 0 && wait.count() > 0) {
        double span = options_.jitter_fraction * static_cast<double>(wait.count());
        double jitter;
        {
            std::lock_guard<std::mutex> lock(rng_mutex_);
            jitter = std::uniform_real_distribution<double>(0.0, span)(rng_);
        }
        wait += std::chrono::milliseconds(static_cast<int64_t>(jitter));
        wait = std::min(wait, options_.max_wait);
    }

    context.elapsed_wait += wait;
    return RetryDecision::after(wait);
}

ErrorKind classify_response(const net::HttpResponse& response, bool retry_on_signature_expiry) {
    if (response.is_network_error) {
        return ErrorKind::TransientTransport;
    }
    if (response.ok()) {
        return ErrorKind::None;
    }

    int status = response.status_code;
    if (status == 408 || net::is_throttling_status(status)) {
        return ErrorKind::TransientTransport;
    }
    // 501 Not Implemented and 505 Version Not Supported will not change on retry
    if (net::is_server_error_status(status) && status != 501 && status != 505) {
        return ErrorKind::TransientTransport;
    }
    if (is_signature_expiry(response)) {
        return retry_on_signature_expiry ? ErrorKind::TransientTransport : ErrorKind::FatalTransport;
    }
    if (status == 400 && response.headers.get("x-ms-error-code").value_or("") == "Md5Mismatch") {
        return ErrorKind::Integrity;
    }
    return ErrorKind::FatalTransport;
}

std::string describe_response(const net::HttpResponse& response) {
    if (response.is_network_error) {
        return response.is_timeout ? "timeout: " + response.error : "network error: " + response.error;
    }
    std::string text = "HTTP " + std::to_string(response.status_code);
    if (auto code = response.headers.get("x-ms-error-code")) {
        text += " (" + *code + ")";
    }
    return text;
}

}  // namespace blobmover
