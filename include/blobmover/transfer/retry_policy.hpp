#pragma once

#include "blobmover/core/constants.hpp"
#include "blobmover/net/http.hpp"
#include "blobmover/transfer/errors.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace blobmover {

struct RetryOptions {
    // Total attempts allowed per chunk (or per whole-operation request)
    uint32_t max_attempts = constants::DEFAULT_MAX_RETRY_ATTEMPTS;
    std::chrono::milliseconds base_wait{constants::DEFAULT_RETRY_BASE_WAIT_MS};
    std::chrono::milliseconds max_wait{constants::DEFAULT_RETRY_MAX_WAIT_MS};
    double jitter_fraction = constants::DEFAULT_RETRY_JITTER_FRACTION;

    // An expired signature is retried (the transport re-signs every attempt)
    bool retry_on_signature_expiry = true;
};

/// State of one retry decision. Created per failure; chunk_index is empty for
/// whole-operation requests such as the initial properties lookup.
struct RetryContext {
    uint32_t attempt = 0;          // attempts made so far, including the failed one
    ErrorKind last_error = ErrorKind::None;
    int http_status = 0;
    std::string message;
    std::chrono::milliseconds elapsed_wait{0};
    std::optional<size_t> chunk_index;
};

struct RetryDecision {
    bool retry = false;
    std::chrono::milliseconds wait{0};

    static RetryDecision stop() { return {}; }
    static RetryDecision after(std::chrono::milliseconds wait) { return {true, wait}; }
};

/// Decides whether a failed attempt is retried and how long to wait first.
/// The only mutable state is the jitter generator, so one policy can serve
/// every worker of a transfer.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryOptions options = {}, std::optional<uint64_t> seed = std::nullopt);

    /// Returns stop() for fatal errors or once the attempt budget is spent,
    /// otherwise the jittered backoff. Adds the chosen wait to context.elapsed_wait.
    RetryDecision should_retry(RetryContext& context) const;

    /// min(max_wait, base_wait * 2^(attempt-1)) without jitter.
    std::chrono::milliseconds backoff(uint32_t attempt) const;

    /// Whether `kind` may be retried in the given scope. Per-chunk checksum
    /// mismatches are retried (the chunk is transferred again); everything
    /// else outside TransientTransport is fatal.
    static bool is_transient(ErrorKind kind, bool chunk_scope);

    const RetryOptions& options() const { return options_; }

private:
    RetryOptions options_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937_64 rng_;
};

/// Map an HTTP response to an error kind (None for success).
ErrorKind classify_response(const net::HttpResponse& response, bool retry_on_signature_expiry = true);

/// "HTTP 503 (ServerBusy)" or the network error text, for logs and results.
std::string describe_response(const net::HttpResponse& response);

}  // namespace blobmover
