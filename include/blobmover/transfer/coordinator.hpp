#pragma once

#include "blobmover/core/cancellation.hpp"
#include "blobmover/core/constants.hpp"
#include "blobmover/net/http.hpp"
#include "blobmover/transfer/blob_endpoint.hpp"
#include "blobmover/transfer/data_source.hpp"
#include "blobmover/transfer/errors.hpp"
#include "blobmover/transfer/integrity.hpp"
#include "blobmover/transfer/retry_policy.hpp"
#include "blobmover/transfer/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blobmover {

class TransferMetrics;

/// What happens to remote state when a transfer fails.
enum class FailurePolicy {
    Abandon,   // leave staged blocks uncommitted and created blobs in place
    Rollback   // additionally delete a page/append blob this transfer created
};

const char* failure_policy_name(FailurePolicy policy);

/// (bytes transferred so far, total bytes). Calls are serialized.
using ProgressCallback = std::function<void(uint64_t, uint64_t)>;

struct TransferOptions {
    // Chunking
    uint64_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    uint64_t single_shot_threshold = constants::DEFAULT_SINGLE_SHOT_THRESHOLD;
    std::optional<size_t> max_chunk_count = constants::DEFAULT_MAX_CHUNK_COUNT;
    size_t max_connections = constants::DEFAULT_MAX_CONNECTIONS;

    // Retry
    uint32_t max_retry_attempts = constants::DEFAULT_MAX_RETRY_ATTEMPTS;
    std::chrono::milliseconds retry_base_wait{constants::DEFAULT_RETRY_BASE_WAIT_MS};
    std::chrono::milliseconds retry_max_wait{constants::DEFAULT_RETRY_MAX_WAIT_MS};
    double retry_jitter_fraction = constants::DEFAULT_RETRY_JITTER_FRACTION;
    bool retry_on_signature_expiry = true;
    std::optional<uint64_t> retry_seed;  // fixed jitter sequence (tests)

    // Applied to each request individually; zero defers to the transport
    std::chrono::milliseconds request_timeout{0};

    // Integrity
    bool validate_content = false;
    DigestAlgorithm digest_algorithm = DigestAlgorithm::MD5;
    std::string expected_digest;  // base64; compared in the Validating stage when set

    // Upload target kind (ignored by downloads)
    BlobType blob_type = BlobType::Block;

    FailurePolicy on_failure = FailurePolicy::Abandon;

    // Prometheus textfile rewritten after each transfer when metrics are attached
    std::filesystem::path metrics_file;

    std::shared_ptr<CancellationToken> cancellation_token;
    ProgressCallback progress;

    RetryOptions retry_options() const;
};

struct TransferResult {
    bool success = false;

    // Done on success, otherwise the stage that failed
    TransferStage stage = TransferStage::Planning;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    uint64_t total_bytes = 0;
    bool single_shot = false;

    std::vector<uint8_t> digest;
    std::string digest_base64;

    size_t chunks_total = 0;
    size_t chunks_succeeded = 0;
    uint32_t retries = 0;
    std::vector<WorkerOutcome> chunk_outcomes;

    std::string etag;
};

/// Runs one upload or one download of a single blob URL:
/// Planning -> InFlight -> Validating -> Committing -> Done, or Failed.
///
/// A coordinator is single-use; create a new one to repeat a transfer.
/// Runtime failures are reported in the TransferResult, never thrown.
class TransferCoordinator {
public:
    TransferCoordinator(net::Transport& transport,
                        std::string blob_url,
                        TransferOptions options = {},
                        TransferMetrics* metrics = nullptr);

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    /// Upload `size` bytes of `source` (nullopt = ask the source).
    /// Throws std::logic_error if the coordinator was already used.
    TransferResult upload(DataSource& source, std::optional<int64_t> size = std::nullopt);

    /// Download the blob into `sink`. Without `expected_size` the size is
    /// looked up with Get Blob Properties first.
    /// Throws std::logic_error if the coordinator was already used.
    TransferResult download(DataSink& sink, std::optional<int64_t> expected_size = std::nullopt);

    TransferStage state() const { return state_.load(); }
    const TransferOptions& options() const { return options_; }

private:
    struct OperationResponse {
        net::HttpResponse response;
        ErrorKind error = ErrorKind::None;
        std::string message;

        bool ok() const { return error == ErrorKind::None; }
    };

    void claim();
    void enter(TransferStage stage);
    bool cancelled() const;

    /// Send one whole-operation request (not tied to a chunk) under the
    /// operation-scope retry policy.
    OperationResponse execute_operation(net::HttpRequest request, const char* what);

    void run_upload(DataSource& source, std::optional<int64_t> size, TransferResult& result);
    void run_download(DataSink& sink, std::optional<int64_t> expected_size, TransferResult& result);

    PoolResult run_pool(const TransferPlan& plan,
                        const ChunkJobFactory& factory,
                        IntegrityAccumulator& accumulator,
                        bool upload,
                        TransferResult& result);

    /// Compare the accumulated digest with `reference` (base64). Empty
    /// reference passes.
    bool validate_digest(const std::string& reference, const char* source, TransferResult& result);

    TransferResult& fail(TransferResult& result, ErrorKind kind, const std::string& message);
    /// Apply the failure policy to remote state after a failed upload.
    void rollback_upload();
    void publish_metrics(bool upload, bool success,
                         std::chrono::steady_clock::time_point start) const;

    net::Transport& transport_;
    BlobEndpoint endpoint_;
    TransferOptions options_;
    TransferMetrics* metrics_;
    RetryPolicy retry_;

    std::atomic<bool> used_{false};
    std::atomic<TransferStage> state_{TransferStage::Planning};

    // Remote state left behind by a failed upload
    bool created_blob_ = false;
    bool staged_blocks_ = false;
};

}  // namespace blobmover
