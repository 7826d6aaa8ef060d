#include "blobmover/transfer/coordinator.hpp"
#include "blobmover/core/log.hpp"
#include "blobmover/metrics.hpp"
#include "blobmover/transfer/chunk_planner.hpp"
#include "blobmover/transfer/slice_reader.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace blobmover {

namespace {

/// Response headers worth keeping from chunk requests. Written by workers.
struct ResponseMetadata {
    std::mutex mutex;
    std::string content_md5;
    std::string etag;

    void capture(const net::HttpResponse& response) {
        std::lock_guard<std::mutex> lock(mutex);
        if (auto md5 = response.headers.get("Content-MD5")) content_md5 = *md5;
        if (auto etag_value = response.headers.get("ETag")) etag = *etag_value;
    }
};

std::string md5_base64(std::span<const uint8_t> data) {
    return net::base64_encode(Digest::compute(DigestAlgorithm::MD5, data));
}

double seconds(std::chrono::milliseconds ms) {
    return std::chrono::duration<double>(ms).count();
}

enum class UploadMode {
    SingleShot,  // Put Blob
    Block,       // Put Block, committed later
    Page,        // Put Page at the chunk's range
    Append       // Append Block at the chunk's offset
};

class UploadChunkJob : public ChunkJob {
public:
    UploadChunkJob(net::Transport& transport,
                   const BlobEndpoint& endpoint,
                   const TransferOptions& options,
                   DataSource& source,
                   const ChunkDescriptor& chunk,
                   UploadMode mode,
                   ResponseMetadata& metadata)
        : transport_(transport)
        , endpoint_(endpoint)
        , options_(options)
        , reader_(source, chunk.offset, chunk.length)
        , chunk_(chunk)
        , mode_(mode)
        , metadata_(metadata) {}

    AttemptResult attempt() override {
        data_ = reader_.read_remaining();
        if (data_.size() != chunk_.length) {
            throw TransferError(ErrorKind::LocalIo,
                                "source ended at byte " + std::to_string(chunk_.offset + data_.size()) +
                                ", expected " + std::to_string(chunk_.end()));
        }

        // Page and append writes of nothing have no request form
        if (data_.empty() && (mode_ == UploadMode::Page || mode_ == UploadMode::Append)) {
            return AttemptResult::success(0);
        }

        std::string chunk_md5 = options_.validate_content ? md5_base64(data_) : std::string();

        net::HttpRequest request;
        switch (mode_) {
            case UploadMode::SingleShot:
                request = endpoint_.put_blob(data_, chunk_md5);
                break;
            case UploadMode::Block:
                request = endpoint_.put_block(BlobEndpoint::block_id_for_offset(chunk_.offset),
                                              data_, chunk_md5);
                break;
            case UploadMode::Page:
                request = endpoint_.put_page(chunk_.range(), data_, chunk_md5);
                break;
            case UploadMode::Append:
                request = endpoint_.append_block(chunk_.offset, data_, chunk_md5);
                break;
        }
        request.timeout = options_.request_timeout;

        auto response = transport_.execute(request);
        ErrorKind kind = classify_response(response, options_.retry_on_signature_expiry);
        if (kind != ErrorKind::None) {
            return AttemptResult::failure(kind, response.status_code, describe_response(response));
        }

        if (mode_ == UploadMode::SingleShot) {
            metadata_.capture(response);
        }
        return AttemptResult::success(data_.size(), std::move(chunk_md5));
    }

    void reset() override {
        reader_.reset();
        data_.clear();
    }

    std::span<const uint8_t> payload() const override { return data_; }

private:
    net::Transport& transport_;
    const BlobEndpoint& endpoint_;
    const TransferOptions& options_;
    BoundedSliceReader reader_;
    ChunkDescriptor chunk_;
    UploadMode mode_;
    ResponseMetadata& metadata_;
    std::vector<uint8_t> data_;
};

class DownloadChunkJob : public ChunkJob {
public:
    DownloadChunkJob(net::Transport& transport,
                     const BlobEndpoint& endpoint,
                     const TransferOptions& options,
                     DataSink& sink,
                     const ChunkDescriptor& chunk,
                     bool single_shot,
                     ResponseMetadata& metadata)
        : transport_(transport)
        , endpoint_(endpoint)
        , options_(options)
        , writer_(sink, chunk.offset, chunk.length)
        , chunk_(chunk)
        , single_shot_(single_shot)
        , metadata_(metadata) {}

    AttemptResult attempt() override {
        const bool want_range_md5 = options_.validate_content && !single_shot_ &&
                                    chunk_.length <= constants::MAX_RANGE_MD5_SIZE;

        net::HttpRequest request = single_shot_
            ? endpoint_.get_blob()
            : endpoint_.get_range(chunk_.range(), want_range_md5);
        request.timeout = options_.request_timeout;

        auto response = transport_.execute(request);
        ErrorKind kind = classify_response(response, options_.retry_on_signature_expiry);
        if (kind != ErrorKind::None) {
            return AttemptResult::failure(kind, response.status_code, describe_response(response));
        }

        if (response.body.size() != chunk_.length) {
            std::string message = "expected " + std::to_string(chunk_.length) + " bytes, received " +
                                  std::to_string(response.body.size());
            // A whole-blob read of the wrong size means the blob is not the expected size;
            // a short range is a truncated response
            return AttemptResult::failure(
                single_shot_ ? ErrorKind::InvalidSize : ErrorKind::TransientTransport,
                response.status_code, message);
        }

        std::string chunk_md5;
        if (want_range_md5) {
            chunk_md5 = md5_base64(response.body);
            auto served = response.headers.get("Content-MD5");
            if (served && *served != chunk_md5) {
                return AttemptResult::failure(
                    ErrorKind::Integrity, response.status_code,
                    "range " + chunk_.range().to_header() + " MD5 mismatch: service " + *served +
                    ", received " + chunk_md5);
            }
        }

        if (single_shot_) {
            metadata_.capture(response);
        }

        writer_.write(response.body);
        body_ = std::move(response.body);
        return AttemptResult::success(body_.size(), std::move(chunk_md5));
    }

    void reset() override {
        writer_.reset();
        body_.clear();
    }

    std::span<const uint8_t> payload() const override { return body_; }

private:
    net::Transport& transport_;
    const BlobEndpoint& endpoint_;
    const TransferOptions& options_;
    BoundedSliceWriter writer_;
    ChunkDescriptor chunk_;
    bool single_shot_;
    ResponseMetadata& metadata_;
    std::vector<uint8_t> body_;
};

// Sequential read of at most `limit` bytes; stops early at end of stream
void fill_buffer(DataSource& source, uint64_t limit, std::vector<uint8_t>& out) {
    constexpr size_t kBlock = 64 * 1024;
    while (out.size() < limit) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(kBlock, limit - out.size()));
        size_t filled = out.size();
        out.resize(filled + want);
        size_t n = source.read(std::span<uint8_t>(out).subspan(filled, want));
        out.resize(filled + n);
        if (n == 0) break;
    }
}

}  // namespace

const char* failure_policy_name(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::Abandon: return "abandon";
        case FailurePolicy::Rollback: return "rollback";
    }
    return "abandon";
}

RetryOptions TransferOptions::retry_options() const {
    RetryOptions retry;
    retry.max_attempts = max_retry_attempts;
    retry.base_wait = retry_base_wait;
    retry.max_wait = retry_max_wait;
    retry.jitter_fraction = retry_jitter_fraction;
    retry.retry_on_signature_expiry = retry_on_signature_expiry;
    return retry;
}

TransferCoordinator::TransferCoordinator(net::Transport& transport,
                                         std::string blob_url,
                                         TransferOptions options,
                                         TransferMetrics* metrics)
    : transport_(transport)
    , endpoint_(std::move(blob_url))
    , options_(std::move(options))
    , metrics_(metrics)
    , retry_(options_.retry_options(), options_.retry_seed) {}

void TransferCoordinator::claim() {
    if (used_.exchange(true)) {
        throw std::logic_error("TransferCoordinator is single-use; create a new one to transfer again");
    }
}

void TransferCoordinator::enter(TransferStage stage) {
    log_debug("%s: stage %s", endpoint_.url().c_str(), stage_name(stage));
    state_.store(stage);
}

bool TransferCoordinator::cancelled() const {
    return options_.cancellation_token && options_.cancellation_token->is_cancelled();
}

TransferResult& TransferCoordinator::fail(TransferResult& result, ErrorKind kind,
                                          const std::string& message) {
    if (state_.load() == TransferStage::Failed) return result;

    result.success = false;
    result.stage = state_.load();
    result.error = kind;
    result.error_message = message;
    state_.store(TransferStage::Failed);

    if (kind == ErrorKind::Cancelled) {
        log_warn("%s: cancelled during %s (%zu of %zu chunks done)", endpoint_.url().c_str(),
                 stage_name(result.stage), result.chunks_succeeded, result.chunks_total);
    } else {
        log_error("%s: %s during %s: %s (%zu of %zu chunks succeeded)", endpoint_.url().c_str(),
                  error_kind_name(kind), stage_name(result.stage), message.c_str(),
                  result.chunks_succeeded, result.chunks_total);
    }
    return result;
}

TransferCoordinator::OperationResponse
TransferCoordinator::execute_operation(net::HttpRequest request, const char* what) {
    request.timeout = options_.request_timeout;

    OperationResponse out;
    RetryContext context;
    while (true) {
        if (cancelled()) {
            out.error = ErrorKind::Cancelled;
            out.message = std::string(what) + ": cancelled";
            return out;
        }

        out.response = transport_.execute(request);
        ++context.attempt;
        out.error = classify_response(out.response, options_.retry_on_signature_expiry);
        if (out.ok()) {
            out.message.clear();
            return out;
        }
        out.message = std::string(what) + ": " + describe_response(out.response);

        context.last_error = out.error;
        context.http_status = out.response.status_code;
        context.message = out.message;
        RetryDecision decision = retry_.should_retry(context);
        if (!decision.retry) {
            return out;
        }

        log_warn("%s attempt %u failed (%s), retrying in %lld ms", what, context.attempt,
                 out.message.c_str(), static_cast<long long>(decision.wait.count()));
        if (metrics_) metrics_->record_retry();

        if (options_.cancellation_token) {
            if (options_.cancellation_token->wait_for(decision.wait)) {
                out.error = ErrorKind::Cancelled;
                out.message = std::string(what) + ": cancelled while waiting to retry";
                return out;
            }
        } else {
            std::this_thread::sleep_for(decision.wait);
        }
    }
}

PoolResult TransferCoordinator::run_pool(const TransferPlan& plan,
                                         const ChunkJobFactory& factory,
                                         IntegrityAccumulator& accumulator,
                                         bool upload,
                                         TransferResult& result) {
    TransferWorkerPool pool(plan, retry_, options_.cancellation_token);
    pool.set_retry_observer([this](const RetryContext& context, const RetryDecision&) {
        if (!metrics_) return;
        metrics_->record_retry();
        if (context.last_error == ErrorKind::Integrity) metrics_->record_integrity_failure();
    });

    std::mutex progress_mutex;
    uint64_t transferred = 0;
    if (options_.progress) {
        options_.progress(0, plan.total_size);
    }

    auto on_complete = [&](const WorkerOutcome& outcome, ChunkJob& job) {
        accumulator.ingest(outcome.index, job.payload());
        if (options_.progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            transferred += outcome.bytes_transferred;
            options_.progress(transferred, plan.total_size);
        }
    };

    PoolResult pool_result = pool.run(factory, on_complete);

    result.chunks_succeeded = pool_result.chunks_succeeded;
    result.retries = pool_result.retries;
    result.chunk_outcomes = pool_result.outcomes;

    if (metrics_) {
        for (const auto& outcome : pool_result.outcomes) {
            metrics_->record_chunk(upload, outcome.success, outcome.bytes_transferred,
                                   seconds(outcome.duration));
            if (!outcome.success && outcome.error == ErrorKind::Integrity) {
                metrics_->record_integrity_failure();
            }
        }
    }
    return pool_result;
}

bool TransferCoordinator::validate_digest(const std::string& reference, const char* source,
                                          TransferResult& result) {
    if (reference.empty()) {
        log_debug("%s: no reference digest, %s %s not compared", endpoint_.url().c_str(),
                  digest_algorithm_name(options_.digest_algorithm), result.digest_base64.c_str());
        return true;
    }
    if (reference == result.digest_base64) {
        log_debug("%s: digest matches %s", endpoint_.url().c_str(), source);
        return true;
    }
    if (metrics_) metrics_->record_integrity_failure();
    fail(result, ErrorKind::Integrity,
         std::string("digest mismatch against ") + source + ": expected " + reference +
         ", computed " + result.digest_base64);
    return false;
}

// --- Upload ---

TransferResult TransferCoordinator::upload(DataSource& source, std::optional<int64_t> size) {
    claim();
    auto start = std::chrono::steady_clock::now();

    TransferResult result;
    try {
        run_upload(source, size, result);
    } catch (const TransferError& e) {
        fail(result, e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(result, ErrorKind::LocalIo, e.what());
    }

    if (!result.success) {
        rollback_upload();
    }
    publish_metrics(true, result.success, start);
    return result;
}

void TransferCoordinator::run_upload(DataSource& source, std::optional<int64_t> size,
                                     TransferResult& result) {
    enter(TransferStage::Planning);

    const BlobType type = options_.blob_type;
    if (!size) {
        if (auto known = source.size()) size = static_cast<int64_t>(*known);
    }

    ChunkPolicy policy;
    policy.chunk_size = options_.chunk_size;
    policy.single_shot_threshold = options_.single_shot_threshold;
    policy.max_chunk_count = options_.max_chunk_count;
    policy.alignment = type == BlobType::Page ? constants::PAGE_ALIGNMENT : 1;
    policy.allow_single_shot = type == BlobType::Block;

    // Appends must land in order
    const size_t connections = type == BlobType::Append ? 1 : options_.max_connections;

    // A small append-only source is read once into memory so retries can replay it
    DataSource* effective = &source;
    std::vector<uint8_t> buffered;
    std::unique_ptr<MemorySource> buffered_source;
    if (!source.seekable() && (!size || (*size >= 0 &&
        static_cast<uint64_t>(*size) <= options_.single_shot_threshold))) {
        // Without a declared size, read one byte past the threshold to learn
        // whether the stream fits
        const uint64_t limit = size ? static_cast<uint64_t>(*size)
                                    : options_.single_shot_threshold + 1;
        fill_buffer(source, limit, buffered);
        if (size && buffered.size() != static_cast<uint64_t>(*size)) {
            fail(result, ErrorKind::LocalIo,
                 "source ended after " + std::to_string(buffered.size()) + " of " +
                 std::to_string(*size) + " bytes");
            return;
        }
        if (!size && buffered.size() > options_.single_shot_threshold) {
            fail(result, ErrorKind::InvalidSize,
                 "append-only source of unknown size is larger than " +
                 std::to_string(options_.single_shot_threshold) + " bytes");
            return;
        }
        size = static_cast<int64_t>(buffered.size());
        buffered_source = std::make_unique<MemorySource>(buffered);
        effective = buffered_source.get();
        log_debug("%s: buffered %zu bytes of append-only source", endpoint_.url().c_str(),
                  buffered.size());
    }

    TransferPlan plan = ChunkPlanner(policy).plan(size, effective->seekable(), connections);
    result.total_bytes = plan.total_size;
    result.single_shot = plan.single_shot;
    result.chunks_total = plan.chunk_count();

    log_info("upload %s: %llu bytes as %s, %zu chunk(s) of %llu bytes, %zu connection(s)",
             endpoint_.url().c_str(), static_cast<unsigned long long>(plan.total_size),
             blob_type_name(type), plan.chunk_count(),
             static_cast<unsigned long long>(plan.chunk_size), plan.max_connections);

    enter(TransferStage::InFlight);

    if (type != BlobType::Block) {
        auto created = execute_operation(type == BlobType::Page
                                             ? endpoint_.create_page_blob(plan.total_size)
                                             : endpoint_.create_append_blob(),
                                         "create blob");
        if (!created.ok()) {
            fail(result, created.error, created.message);
            return;
        }
        created_blob_ = true;
    }

    UploadMode mode = UploadMode::SingleShot;
    if (!plan.single_shot) {
        mode = type == BlobType::Page ? UploadMode::Page
             : type == BlobType::Append ? UploadMode::Append
             : UploadMode::Block;
    }

    IntegrityAccumulator accumulator(options_.digest_algorithm, plan.chunk_count());
    ResponseMetadata metadata;
    ChunkJobFactory factory = [&](const ChunkDescriptor& chunk) -> std::unique_ptr<ChunkJob> {
        return std::make_unique<UploadChunkJob>(transport_, endpoint_, options_, *effective,
                                                chunk, mode, metadata);
    };

    staged_blocks_ = mode == UploadMode::Block;
    PoolResult pool_result = run_pool(plan, factory, accumulator, true, result);
    if (!pool_result.success) {
        fail(result, pool_result.error, pool_result.error_message);
        return;
    }

    enter(TransferStage::Validating);
    result.digest = accumulator.finalize();
    result.digest_base64 = net::base64_encode(result.digest);

    std::string reference = options_.expected_digest;
    const char* reference_source = "expected digest";
    if (reference.empty() && options_.validate_content && plan.single_shot &&
        options_.digest_algorithm == DigestAlgorithm::MD5) {
        reference = metadata.content_md5;
        reference_source = "service Content-MD5";
    }
    if (!validate_digest(reference, reference_source, result)) {
        return;
    }

    enter(TransferStage::Committing);
    if (mode == UploadMode::Block) {
        std::vector<std::string> block_ids;
        block_ids.reserve(plan.chunk_count());
        for (const auto& chunk : plan.chunks) {
            block_ids.push_back(BlobEndpoint::block_id_for_offset(chunk.offset));
        }
        std::string blob_md5;
        if (options_.validate_content && options_.digest_algorithm == DigestAlgorithm::MD5) {
            blob_md5 = result.digest_base64;
        }

        auto committed = execute_operation(endpoint_.put_block_list(block_ids, blob_md5),
                                           "commit block list");
        if (!committed.ok()) {
            fail(result, committed.error, committed.message);
            return;
        }
        result.etag = committed.response.headers.get("ETag").value_or("");
    } else {
        result.etag = metadata.etag;
    }

    enter(TransferStage::Done);
    result.success = true;
    result.stage = TransferStage::Done;
    log_info("upload %s: done, %llu bytes, %s %s, %u retries", endpoint_.url().c_str(),
             static_cast<unsigned long long>(result.total_bytes),
             digest_algorithm_name(options_.digest_algorithm), result.digest_base64.c_str(),
             result.retries);
}

void TransferCoordinator::publish_metrics(bool upload, bool success,
                                          std::chrono::steady_clock::time_point start) const {
    if (!metrics_) return;
    metrics_->record_transfer(
        upload, success,
        std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
    if (!options_.metrics_file.empty() && !metrics_->write_textfile(options_.metrics_file)) {
        log_warn("%s: metrics textfile %s not updated", endpoint_.url().c_str(),
                 options_.metrics_file.c_str());
    }
}

void TransferCoordinator::rollback_upload() {
    if (options_.blob_type == BlobType::Block) {
        if (staged_blocks_) {
            log_info("%s: staged blocks left uncommitted", endpoint_.url().c_str());
        }
        return;
    }
    if (!created_blob_) return;

    if (options_.on_failure != FailurePolicy::Rollback) {
        log_warn("%s: %s blob left in place (failure policy %s)", endpoint_.url().c_str(),
                 blob_type_name(options_.blob_type), failure_policy_name(options_.on_failure));
        return;
    }

    // Sent once and regardless of cancellation
    auto request = endpoint_.delete_blob();
    request.timeout = options_.request_timeout;
    auto response = transport_.execute(request);
    if (response.ok()) {
        log_info("%s: rolled back, blob deleted", endpoint_.url().c_str());
    } else {
        log_error("%s: rollback delete failed: %s", endpoint_.url().c_str(),
                  describe_response(response).c_str());
    }
}

// --- Download ---

TransferResult TransferCoordinator::download(DataSink& sink, std::optional<int64_t> expected_size) {
    claim();
    auto start = std::chrono::steady_clock::now();

    TransferResult result;
    try {
        run_download(sink, expected_size, result);
    } catch (const TransferError& e) {
        fail(result, e.kind(), e.what());
    } catch (const std::exception& e) {
        fail(result, ErrorKind::LocalIo, e.what());
    }

    if (!result.success) {
        try {
            sink.discard();
            log_warn("%s: partial download discarded", endpoint_.url().c_str());
        } catch (const TransferError& e) {
            log_error("%s: discarding partial download failed: %s", endpoint_.url().c_str(), e.what());
        }
    }
    publish_metrics(false, result.success, start);
    return result;
}

void TransferCoordinator::run_download(DataSink& sink, std::optional<int64_t> expected_size,
                                       TransferResult& result) {
    enter(TransferStage::Planning);

    if (expected_size && *expected_size < 0) {
        fail(result, ErrorKind::InvalidSize,
             "expected size is negative: " + std::to_string(*expected_size));
        return;
    }

    std::optional<BlobProperties> properties;
    if (!expected_size || (options_.validate_content && options_.expected_digest.empty())) {
        auto response = execute_operation(endpoint_.get_properties(), "get blob properties");
        if (!response.ok()) {
            fail(result, response.error, response.message);
            return;
        }
        properties = BlobProperties::from_response(response.response);
        if (expected_size && properties->content_length != static_cast<uint64_t>(*expected_size)) {
            fail(result, ErrorKind::InvalidSize,
                 "blob is " + std::to_string(properties->content_length) + " bytes, expected " +
                 std::to_string(*expected_size));
            return;
        }
    }

    const int64_t total = expected_size
        ? *expected_size
        : static_cast<int64_t>(properties->content_length);

    ChunkPolicy policy;
    policy.chunk_size = options_.chunk_size;
    policy.single_shot_threshold = options_.single_shot_threshold;
    policy.max_chunk_count = options_.max_chunk_count;

    // Destination ranges are independent, so the destination never needs rewinding
    TransferPlan plan = ChunkPlanner(policy).plan(total, true, options_.max_connections);
    result.total_bytes = plan.total_size;
    result.single_shot = plan.single_shot;
    result.chunks_total = plan.chunk_count();

    log_info("download %s: %llu bytes, %zu chunk(s) of %llu bytes, %zu connection(s)",
             endpoint_.url().c_str(), static_cast<unsigned long long>(plan.total_size),
             plan.chunk_count(), static_cast<unsigned long long>(plan.chunk_size),
             plan.max_connections);

    enter(TransferStage::InFlight);
    sink.preallocate(plan.total_size);

    IntegrityAccumulator accumulator(options_.digest_algorithm, plan.chunk_count());
    ResponseMetadata metadata;
    ChunkJobFactory factory = [&](const ChunkDescriptor& chunk) -> std::unique_ptr<ChunkJob> {
        return std::make_unique<DownloadChunkJob>(transport_, endpoint_, options_, sink, chunk,
                                                  plan.single_shot, metadata);
    };

    PoolResult pool_result = run_pool(plan, factory, accumulator, false, result);
    if (!pool_result.success) {
        fail(result, pool_result.error, pool_result.error_message);
        return;
    }

    enter(TransferStage::Validating);
    result.digest = accumulator.finalize();
    result.digest_base64 = net::base64_encode(result.digest);

    std::string reference = options_.expected_digest;
    const char* reference_source = "expected digest";
    if (reference.empty() && options_.validate_content &&
        options_.digest_algorithm == DigestAlgorithm::MD5) {
        reference = properties ? properties->content_md5 : metadata.content_md5;
        reference_source = "service Content-MD5";
    }
    if (!validate_digest(reference, reference_source, result)) {
        return;
    }

    enter(TransferStage::Committing);
    sink.commit();
    result.etag = properties ? properties->etag : metadata.etag;

    enter(TransferStage::Done);
    result.success = true;
    result.stage = TransferStage::Done;
    log_info("download %s: done, %llu bytes, %s %s, %u retries", endpoint_.url().c_str(),
             static_cast<unsigned long long>(result.total_bytes),
             digest_algorithm_name(options_.digest_algorithm), result.digest_base64.c_str(),
             result.retries);
}

}  // namespace blobmover
