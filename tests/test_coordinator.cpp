// End-to-end tests for TransferCoordinator against the in-memory blob service.
//
// Tests:
//   1. Round trips (single-shot, chunked, concurrency levels)
//   2. Empty payloads
//   3. Retry and fatal failures
//   4. Cancellation
//   5. Integrity (range MD5, whole-payload digest)
//   6. Page and append blobs, failure policy
//   7. Downloads (size negotiation, file destination)
//   8. Append-only sources
//   9. Progress, metrics and single use

#include "blobmover/metrics.hpp"
#include "blobmover/transfer/coordinator.hpp"

#include "fake_blob_service.hpp"
#include "test_harness.hpp"

#include <mutex>
#include <random>
#include <sstream>

namespace fs = std::filesystem;
using namespace blobmover;
using namespace std::chrono_literals;
using blobmover::testing::FakeBlobService;

static const std::string kUrl = "https://acct.blob.core.windows.net/data/payload.bin";
static const std::string kEmptyMd5 = "1B2M2Y8AsgTpgAmY7PhCfg==";

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static std::vector<uint8_t> pattern(size_t size, uint32_t seed = 1) {
    std::vector<uint8_t> data(size);
    std::mt19937 rng(seed);
    for (auto& b : data) b = static_cast<uint8_t>(rng());
    return data;
}

/// Chunked transfer with short retry waits. Payloads up to `chunk` bytes
/// still travel single-shot.
static TransferOptions chunked(uint64_t chunk, size_t connections) {
    TransferOptions options;
    options.chunk_size = chunk;
    options.single_shot_threshold = chunk;
    options.max_connections = connections;
    options.max_retry_attempts = 3;
    options.retry_base_wait = 1ms;
    options.retry_max_wait = 4ms;
    options.retry_jitter_fraction = 0.0;
    return options;
}

static std::string kind(ErrorKind k) {
    return error_kind_name(k);
}

static std::string stage(TransferStage s) {
    return stage_name(s);
}

// ---------------------------------------------------------------------------
// 1. Round trips
// ---------------------------------------------------------------------------

static void test_round_trips() {
    std::cout << "\n=== Round trips ===" << std::endl;

    {
        TEST(ten_megabyte_block_upload);
        FakeBlobService fake;
        auto data = pattern(10000000);
        MemorySource source(data);
        TransferCoordinator coordinator(fake, kUrl, chunked(4000000, 2));
        auto result = coordinator.upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_EQ(stage(result.stage), stage(TransferStage::Done), "stage");
        ASSERT_EQ(result.chunks_total, 3u, "chunks");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "block"), 3u, "put block requests");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "blocklist"), 1u, "commit requests");
        ASSERT_TRUE(fake.blob(kUrl)->data == data, "committed blob differs");
        ASSERT_NOT_EMPTY(result.etag, "etag");
        ASSERT_EQ(stage(coordinator.state()), stage(TransferStage::Done), "coordinator state");
        PASS();
    }

    for (size_t connections : {1u, 4u, 16u}) {
        TEST(upload_then_download_round_trip);
        std::cout << "[" << connections << " connection(s)] " << std::flush;
        FakeBlobService fake;
        fake.latency = 2ms;
        auto data = pattern(16 * 1000 + 17, static_cast<uint32_t>(connections));

        MemorySource source(data);
        auto up = TransferCoordinator(fake, kUrl, chunked(1000, connections)).upload(source);
        ASSERT_TRUE(up.success, "upload failed: " + up.error_message);
        ASSERT_EQ(up.chunks_total, 17u, "upload chunks");
        ASSERT_TRUE(fake.peak_in_flight() <= static_cast<int>(connections), "too many requests in flight");

        MemorySink sink;
        auto down = TransferCoordinator(fake, kUrl, chunked(1000, connections)).download(sink);
        ASSERT_TRUE(down.success, "download failed: " + down.error_message);
        ASSERT_TRUE(sink.committed(), "sink not committed");
        ASSERT_TRUE(sink.data() == data, "downloaded bytes differ");
        ASSERT_TRUE(up.digest == down.digest, "upload and download digests differ");
        PASS();
    }

    {
        TEST(parallel_chunks_overlap);
        FakeBlobService fake;
        fake.latency = 20ms;
        auto data = pattern(8 * 512);
        MemorySource source(data);
        auto result = TransferCoordinator(fake, kUrl, chunked(512, 4)).upload(source);
        ASSERT_TRUE(result.success, "upload failed");
        ASSERT_TRUE(fake.peak_in_flight() >= 2, "no overlap between chunk requests");
        ASSERT_TRUE(fake.peak_in_flight() <= 4, "bound exceeded");
        PASS();
    }

    {
        TEST(small_upload_is_one_put_blob);
        FakeBlobService fake;
        auto data = pattern(3000);
        MemorySource source(data);
        auto result = TransferCoordinator(fake, kUrl, chunked(4096, 4)).upload(source);
        ASSERT_TRUE(result.success, "upload failed");
        ASSERT_TRUE(result.single_shot, "single shot");
        ASSERT_EQ(fake.requests().size(), 1u, "requests");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "block"), 0u, "no blocks");
        ASSERT_TRUE(fake.blob(kUrl)->data == data, "content");
        PASS();
    }

    {
        TEST(sha256_digest_of_payload);
        FakeBlobService fake;
        auto data = pattern(5000);
        MemorySource source(data);
        auto options = chunked(1024, 3);
        options.digest_algorithm = DigestAlgorithm::SHA256;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(result.success, "upload failed");
        ASSERT_TRUE(result.digest == Digest::compute(DigestAlgorithm::SHA256, data), "digest");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Empty payloads
// ---------------------------------------------------------------------------

static void test_empty_payloads() {
    std::cout << "\n=== Empty payloads ===" << std::endl;

    {
        TEST(empty_upload);
        FakeBlobService fake;
        std::vector<uint8_t> nothing;
        MemorySource source(nothing);
        auto result = TransferCoordinator(fake, kUrl, chunked(1024, 4)).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_EQ(result.chunks_total, 1u, "one zero-length chunk");
        ASSERT_EQ(result.digest_base64, kEmptyMd5, "digest of nothing");
        ASSERT_TRUE(fake.exists(kUrl), "blob created");
        ASSERT_EQ(fake.blob(kUrl)->data.size(), 0u, "blob empty");
        PASS();
    }

    {
        TEST(empty_download);
        FakeBlobService fake;
        fake.put(kUrl, {});
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, chunked(1024, 4)).download(sink);
        ASSERT_TRUE(result.success, "download failed: " + result.error_message);
        ASSERT_EQ(sink.size(), 0u, "size");
        ASSERT_TRUE(sink.committed(), "committed");
        ASSERT_EQ(result.digest_base64, kEmptyMd5, "digest of nothing");
        PASS();
    }

    {
        TEST(empty_page_blob_needs_no_page_writes);
        FakeBlobService fake;
        std::vector<uint8_t> nothing;
        MemorySource source(nothing);
        auto options = chunked(1024, 2);
        options.blob_type = BlobType::Page;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "page"), 0u, "no page writes");
        ASSERT_EQ(fake.blob(kUrl)->type, "PageBlob", "type");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Retry and fatal failures
// ---------------------------------------------------------------------------

static void test_retries() {
    std::cout << "\n=== Retry and fatal failures ===" << std::endl;

    {
        TEST(transient_failures_below_budget_recover);
        FakeBlobService fake;
        fake.transient_failures_per_chunk = 2;
        auto data = pattern(4000);
        MemorySource source(data);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_EQ(result.retries, 8u, "two retries per chunk");
        for (const auto& o : result.chunk_outcomes) {
            ASSERT_EQ(o.attempts, 3u, "attempts");
        }
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "block"), 12u, "requests sent");
        ASSERT_TRUE(fake.blob(kUrl)->data == data, "content");
        PASS();
    }

    {
        TEST(transient_failures_at_budget_fail);
        FakeBlobService fake;
        fake.transient_failures_per_chunk = 3;
        auto data = pattern(2000);
        MemorySource source(data);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 1)).upload(source);
        ASSERT_TRUE(!result.success, "upload should fail");
        ASSERT_EQ(kind(result.error), kind(ErrorKind::TransientTransport), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::InFlight), "stage");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "blocklist"), 0u, "never committed");
        PASS();
    }

    {
        TEST(throttling_is_retried);
        FakeBlobService fake;
        fake.transient_failures_per_chunk = 1;
        fake.transient_status = 429;
        auto data = pattern(2000);
        MemorySource source(data);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_EQ(result.retries, 2u, "retries");
        PASS();
    }

    {
        TEST(fatal_chunk_stops_transfer_without_commit);
        FakeBlobService fake;
        fake.fail_offset = 2000;
        auto data = pattern(10000);
        MemorySource source(data);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 1)).upload(source);
        ASSERT_TRUE(!result.success, "upload should fail");
        ASSERT_EQ(kind(result.error), kind(ErrorKind::FatalTransport), "error");
        ASSERT_EQ(result.chunks_succeeded, 2u, "chunks before the failure");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "block"), 3u, "no chunk after the failure");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "blocklist"), 0u, "never committed");
        ASSERT_TRUE(result.error_message.find("403") != std::string::npos, "status in message");
        PASS();
    }

    {
        TEST(missing_blob_fails_during_planning);
        FakeBlobService fake;
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).download(sink);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::FatalTransport), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::Planning), "stage");
        ASSERT_EQ(fake.requests().size(), 1u, "404 not retried");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Cancellation
// ---------------------------------------------------------------------------

static void test_cancellation() {
    std::cout << "\n=== Cancellation ===" << std::endl;

    {
        TEST(cancel_after_first_chunk);
        FakeBlobService fake;
        auto data = pattern(5000);
        MemorySource source(data);
        auto options = chunked(1000, 1);
        options.cancellation_token = std::make_shared<CancellationToken>();
        auto token = options.cancellation_token;
        options.progress = [token](uint64_t transferred, uint64_t) {
            if (transferred >= 1000) token->cancel();
        };
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(!result.success, "must not succeed");
        ASSERT_EQ(kind(result.error), kind(ErrorKind::Cancelled), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::InFlight), "stage");
        ASSERT_EQ(result.chunks_succeeded, 1u, "one chunk");
        ASSERT_EQ(fake.chunk_requests(), 1u, "no chunk request after cancellation");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "blocklist"), 0u, "never committed");
        PASS();
    }

    {
        TEST(cancel_during_retry_wait);
        FakeBlobService fake;
        fake.transient_failures_per_chunk = 100;
        auto data = pattern(2000);
        MemorySource source(data);
        auto options = chunked(1000, 2);
        options.max_retry_attempts = 10;
        options.retry_base_wait = 5s;
        options.retry_max_wait = 5s;
        options.cancellation_token = std::make_shared<CancellationToken>();
        auto token = options.cancellation_token;
        std::thread canceller([token] {
            std::this_thread::sleep_for(100ms);
            token->cancel();
        });
        auto start = std::chrono::steady_clock::now();
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();
        ASSERT_EQ(kind(result.error), kind(ErrorKind::Cancelled), "error");
        ASSERT_TRUE(elapsed < 3s, "retry wait not interrupted");
        PASS();
    }

    {
        TEST(cancelled_before_start);
        FakeBlobService fake;
        auto data = pattern(4096);
        MemorySource source(data);
        auto options = chunked(1024, 2);
        options.blob_type = BlobType::Page;
        options.cancellation_token = std::make_shared<CancellationToken>();
        options.cancellation_token->cancel();
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::Cancelled), "error");
        ASSERT_EQ(fake.requests().size(), 0u, "nothing sent");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Integrity
// ---------------------------------------------------------------------------

static void test_integrity() {
    std::cout << "\n=== Integrity ===" << std::endl;

    {
        TEST(corrupt_range_is_fetched_again);
        FakeBlobService fake;
        auto data = pattern(4000);
        fake.put(kUrl, data);
        fake.corrupt_offset = 1000;
        fake.corrupt_times = 1;
        auto options = chunked(1000, 2);
        options.validate_content = true;
        MemorySink sink;
        TransferMetrics metrics;
        auto result = TransferCoordinator(fake, kUrl, options, &metrics).download(sink);
        ASSERT_TRUE(result.success, "download failed: " + result.error_message);
        ASSERT_TRUE(sink.data() == data, "content");
        ASSERT_EQ(result.chunk_outcomes[1].attempts, 2u, "corrupt chunk attempts");
        ASSERT_EQ(metrics.integrity_failures().Value(), 1.0, "integrity failures counted");
        PASS();
    }

    {
        TEST(persistent_corruption_fails);
        FakeBlobService fake;
        auto data = pattern(4000);
        fake.put(kUrl, data);
        fake.corrupt_offset = 2000;
        auto options = chunked(1000, 1);
        options.validate_content = true;
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, options).download(sink);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::Integrity), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::InFlight), "stage");
        ASSERT_TRUE(sink.incomplete(), "destination marked incomplete");
        ASSERT_TRUE(!sink.committed(), "not committed");
        PASS();
    }

    {
        TEST(validated_download_matches_service_md5);
        FakeBlobService fake;
        auto data = pattern(3500);
        fake.put(kUrl, data);
        auto options = chunked(1000, 2);
        options.validate_content = true;
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, options).download(sink);
        ASSERT_TRUE(result.success, "download failed: " + result.error_message);
        ASSERT_EQ(result.digest_base64, FakeBlobService::md5_of(data), "digest");
        for (const auto& r : fake.requests()) {
            if (r.method == net::HttpMethod::GET) {
                ASSERT_TRUE(r.range_md5_requested, "range MD5 not requested");
            }
        }
        PASS();
    }

    {
        TEST(stored_md5_mismatch_fails_validation);
        FakeBlobService fake;
        auto data = pattern(3000);
        fake.put(kUrl, data);
        fake.set_content_md5(kUrl, kEmptyMd5);
        auto options = chunked(1000, 2);
        options.validate_content = true;
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, options).download(sink);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::Integrity), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::Validating), "stage");
        ASSERT_TRUE(!sink.committed(), "not committed");
        PASS();
    }

    {
        TEST(expected_digest_mismatch_blocks_commit);
        FakeBlobService fake;
        auto data = pattern(3000);
        MemorySource source(data);
        auto options = chunked(1000, 2);
        options.expected_digest = kEmptyMd5;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::Integrity), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::Validating), "stage");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "block"), 3u, "blocks staged");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "blocklist"), 0u, "never committed");
        PASS();
    }

    {
        TEST(expected_digest_match_commits);
        FakeBlobService fake;
        auto data = pattern(3000);
        MemorySource source(data);
        auto options = chunked(1000, 2);
        options.expected_digest = FakeBlobService::md5_of(data);
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        PASS();
    }

    {
        TEST(validated_upload_sends_md5_headers);
        FakeBlobService fake;
        auto data = pattern(3000);
        MemorySource source(data);
        auto options = chunked(1000, 2);
        options.validate_content = true;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        for (const auto& r : fake.requests()) {
            if (r.comp == "block") {
                ASSERT_TRUE(r.had_content_md5, "block without Content-MD5");
            }
        }
        ASSERT_EQ(fake.blob(kUrl)->content_md5, FakeBlobService::md5_of(data), "blob MD5 committed");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Page and append blobs, failure policy
// ---------------------------------------------------------------------------

static void test_blob_types() {
    std::cout << "\n=== Page and append blobs ===" << std::endl;

    {
        TEST(page_blob_upload);
        FakeBlobService fake;
        auto data = pattern(5 * 512);
        MemorySource source(data);
        auto options = chunked(1024, 3);
        options.blob_type = BlobType::Page;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_TRUE(!result.single_shot, "page uploads are chunked");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "page"), 3u, "page writes");
        ASSERT_EQ(fake.blob(kUrl)->type, "PageBlob", "type");
        ASSERT_TRUE(fake.blob(kUrl)->data == data, "content");
        PASS();
    }

    {
        TEST(misaligned_page_blob_rejected);
        FakeBlobService fake;
        auto data = pattern(1000);
        MemorySource source(data);
        auto options = chunked(1024, 2);
        options.blob_type = BlobType::Page;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::InvalidSize), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::Planning), "stage");
        ASSERT_EQ(fake.requests().size(), 0u, "nothing sent");
        PASS();
    }

    {
        TEST(append_blob_upload_in_order);
        FakeBlobService fake;
        auto data = pattern(4500);
        MemorySource source(data);
        auto options = chunked(1000, 8);
        options.blob_type = BlobType::Append;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "appendblock"), 5u, "append requests");
        ASSERT_TRUE(fake.blob(kUrl)->data == data, "content");
        ASSERT_EQ(fake.peak_in_flight(), 1, "appends serialized");
        PASS();
    }

    {
        TEST(rollback_deletes_created_blob);
        FakeBlobService fake;
        fake.fail_offset = 1024;
        auto data = pattern(4096);
        MemorySource source(data);
        auto options = chunked(1024, 1);
        options.blob_type = BlobType::Page;
        options.on_failure = FailurePolicy::Rollback;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::FatalTransport), "error");
        ASSERT_EQ(fake.count(net::HttpMethod::DELETE), 1u, "one delete");
        ASSERT_TRUE(!fake.exists(kUrl), "blob removed");
        PASS();
    }

    {
        TEST(abandon_leaves_created_blob);
        FakeBlobService fake;
        fake.fail_offset = 1000;
        auto data = pattern(3000);
        MemorySource source(data);
        auto options = chunked(1000, 1);
        options.blob_type = BlobType::Append;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(!result.success, "upload should fail");
        ASSERT_EQ(fake.count(net::HttpMethod::DELETE), 0u, "no delete");
        ASSERT_TRUE(fake.exists(kUrl), "blob left in place");
        ASSERT_EQ(fake.blob(kUrl)->data.size(), 1000u, "first append kept");
        PASS();
    }

    {
        TEST(block_rollback_never_deletes);
        FakeBlobService fake;
        fake.fail_offset = 0;
        auto data = pattern(3000);
        MemorySource source(data);
        auto options = chunked(1000, 1);
        options.on_failure = FailurePolicy::Rollback;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(!result.success, "upload should fail");
        ASSERT_EQ(fake.count(net::HttpMethod::DELETE), 0u, "no delete");
        ASSERT_EQ(fake.count(net::HttpMethod::PUT, "blocklist"), 0u, "never committed");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Downloads
// ---------------------------------------------------------------------------

static void test_downloads() {
    std::cout << "\n=== Downloads ===" << std::endl;

    {
        TEST(size_negotiated_with_properties_request);
        FakeBlobService fake;
        auto data = pattern(2500);
        fake.put(kUrl, data);
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).download(sink);
        ASSERT_TRUE(result.success, "download failed: " + result.error_message);
        ASSERT_EQ(fake.count(net::HttpMethod::HEAD), 1u, "one properties request");
        ASSERT_EQ(result.total_bytes, 2500u, "size");
        ASSERT_NOT_EMPTY(result.etag, "etag");
        PASS();
    }

    {
        TEST(known_size_skips_properties_request);
        FakeBlobService fake;
        auto data = pattern(2500);
        fake.put(kUrl, data);
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).download(sink, 2500);
        ASSERT_TRUE(result.success, "download failed: " + result.error_message);
        ASSERT_EQ(fake.count(net::HttpMethod::HEAD), 0u, "no properties request");
        ASSERT_TRUE(sink.data() == data, "content");
        PASS();
    }

    {
        TEST(expected_size_mismatch);
        FakeBlobService fake;
        fake.put(kUrl, pattern(2500));
        auto options = chunked(1000, 2);
        options.validate_content = true;
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, options).download(sink, 3000);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::InvalidSize), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::Planning), "stage");
        PASS();
    }

    {
        TEST(single_shot_size_mismatch);
        FakeBlobService fake;
        fake.put(kUrl, pattern(500));
        MemorySink sink;
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 1)).download(sink, 600);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::InvalidSize), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::InFlight), "stage");
        PASS();
    }

    testing::TempDir tmpdir("blobmover-download");

    {
        TEST(file_destination_committed);
        FakeBlobService fake;
        auto data = pattern(7777);
        fake.put(kUrl, data);
        auto target = tmpdir / "ok.bin";
        FileSink sink(target);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 4)).download(sink);
        ASSERT_TRUE(result.success, "download failed: " + result.error_message);
        ASSERT_TRUE(read_file(target) == data, "file content");
        ASSERT_TRUE(!fs::exists(sink.partial_path()), "partial file left");
        PASS();
    }

    {
        TEST(failed_file_download_leaves_nothing);
        FakeBlobService fake;
        fake.put(kUrl, pattern(5000));
        fake.fail_offset = 3000;
        auto target = tmpdir / "failed.bin";
        FileSink sink(target);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).download(sink);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::FatalTransport), "error");
        ASSERT_TRUE(!fs::exists(target), "target created");
        ASSERT_TRUE(!fs::exists(sink.partial_path()), "partial file left");
        PASS();
    }

}

// ---------------------------------------------------------------------------
// 8. Append-only sources
// ---------------------------------------------------------------------------

static void test_append_only_sources() {
    std::cout << "\n=== Append-only sources ===" << std::endl;

    {
        TEST(small_stream_buffered_and_uploaded);
        FakeBlobService fake;
        auto data = pattern(3000);
        std::istringstream in(std::string(data.begin(), data.end()));
        StreamSource source(in, data.size());
        auto options = chunked(1000, 2);
        options.single_shot_threshold = 4000;
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_TRUE(fake.blob(kUrl)->data == data, "content");
        PASS();
    }

    {
        TEST(large_stream_not_seekable);
        FakeBlobService fake;
        auto data = pattern(3000);
        std::istringstream in(std::string(data.begin(), data.end()));
        StreamSource source(in, data.size());
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).upload(source);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::NotSeekable), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::Planning), "stage");
        ASSERT_EQ(fake.requests().size(), 0u, "nothing sent");
        PASS();
    }

    {
        TEST(short_stream_of_unknown_size_uploads_single_shot);
        FakeBlobService fake;
        std::istringstream in("abcdefghij");
        StreamSource source(in);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        ASSERT_TRUE(result.single_shot, "single shot");
        ASSERT_EQ(result.total_bytes, 10u, "size learned from the stream");
        auto stored = fake.blob(kUrl);
        ASSERT_TRUE(stored.has_value(), "blob stored");
        ASSERT_EQ(std::string(stored->data.begin(), stored->data.end()), "abcdefghij", "content");
        PASS();
    }

    {
        TEST(long_stream_of_unknown_size_rejected);
        FakeBlobService fake;
        auto data = pattern(1001);
        std::istringstream in(std::string(data.begin(), data.end()));
        StreamSource source(in);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).upload(source);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::InvalidSize), "error");
        ASSERT_EQ(stage(result.stage), stage(TransferStage::Planning), "stage");
        ASSERT_EQ(fake.requests().size(), 0u, "nothing sent");
        PASS();
    }

    {
        TEST(stream_shorter_than_declared);
        FakeBlobService fake;
        std::istringstream in("abc");
        StreamSource source(in, 10);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).upload(source);
        ASSERT_EQ(kind(result.error), kind(ErrorKind::LocalIo), "error");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. Progress, metrics and single use
// ---------------------------------------------------------------------------

static void test_progress_and_metrics() {
    std::cout << "\n=== Progress, metrics, single use ===" << std::endl;

    {
        TEST(progress_monotonic_and_complete);
        FakeBlobService fake;
        auto data = pattern(9500);
        MemorySource source(data);
        auto options = chunked(1000, 4);
        std::mutex mutex;
        std::vector<uint64_t> seen;
        options.progress = [&](uint64_t transferred, uint64_t total) {
            std::lock_guard<std::mutex> lock(mutex);
            if (total == 9500) seen.push_back(transferred);
        };
        auto result = TransferCoordinator(fake, kUrl, options).upload(source);
        ASSERT_TRUE(result.success, "upload failed");
        ASSERT_EQ(seen.size(), 11u, "initial report plus one per chunk");
        ASSERT_EQ(seen.front(), 0u, "starts at zero");
        ASSERT_EQ(seen.back(), 9500u, "ends at total");
        ASSERT_TRUE(std::is_sorted(seen.begin(), seen.end()), "progress went backwards");
        PASS();
    }

    {
        TEST(metrics_recorded);
        FakeBlobService fake;
        fake.transient_failures_per_chunk = 1;
        auto data = pattern(3000);
        MemorySource source(data);
        TransferMetrics metrics;
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2), &metrics).upload(source);
        ASSERT_TRUE(result.success, "upload failed");
        MemorySink sink;
        auto down = TransferCoordinator(fake, kUrl, chunked(1000, 2), &metrics).download(sink, 3000);
        ASSERT_TRUE(down.success, "download failed: " + down.error_message);
        ASSERT_EQ(metrics.uploads_success().Value(), 1.0, "uploads");
        ASSERT_EQ(metrics.downloads_success().Value(), 1.0, "downloads");
        ASSERT_EQ(metrics.upload_bytes().Value(), 3000.0, "upload bytes");
        ASSERT_EQ(metrics.download_bytes().Value(), 3000.0, "download bytes");
        ASSERT_EQ(metrics.chunks_success().Value(), 6.0, "chunks");
        ASSERT_EQ(metrics.chunk_retries().Value(), 6.0, "retries");
        PASS();
    }

    {
        TEST(metrics_textfile_written_after_transfer);
        testing::TempDir tmpdir("blobmover-textfile");
        FakeBlobService fake;
        auto data = pattern(2500);
        MemorySource source(data);
        TransferMetrics metrics;
        auto options = chunked(1000, 2);
        options.metrics_file = tmpdir / "blobmover.prom";
        auto result = TransferCoordinator(fake, kUrl, options, &metrics).upload(source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        auto content = read_file(options.metrics_file);
        std::string text(content.begin(), content.end());
        ASSERT_TRUE(text.find("blobmover_transfers_total") != std::string::npos, "textfile content");
        ASSERT_TRUE(!fs::exists(tmpdir / "blobmover.prom.tmp"), "temp file left behind");
        PASS();
    }

    {
        TEST(request_timeout_passed_per_request);
        FakeBlobService fake;
        auto data = pattern(2500);
        MemorySource first_source(data);
        auto result = TransferCoordinator(fake, kUrl, chunked(1000, 2)).upload(first_source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        for (const auto& rec : fake.requests()) {
            ASSERT_EQ(rec.timeout.count(), 0, "transport default used");
        }

        FakeBlobService timed;
        MemorySource second_source(data);
        auto options = chunked(1000, 2);
        options.request_timeout = 7s;
        result = TransferCoordinator(timed, kUrl, options).upload(second_source);
        ASSERT_TRUE(result.success, "upload failed: " + result.error_message);
        for (const auto& rec : timed.requests()) {
            ASSERT_EQ(rec.timeout.count(), 7000, "explicit timeout");
        }
        PASS();
    }

    {
        TEST(coordinator_is_single_use);
        FakeBlobService fake;
        auto data = pattern(100);
        MemorySource source(data);
        TransferCoordinator coordinator(fake, kUrl, chunked(1000, 1));
        auto first = coordinator.upload(source);
        ASSERT_TRUE(first.success, "first upload failed");
        bool threw = false;
        try {
            MemorySink sink;
            coordinator.download(sink);
        } catch (const std::logic_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "reuse must throw");
        PASS();
    }
}

int main() {
    std::cout << "blobmover coordinator tests" << std::endl;
    std::cout << "===========================" << std::endl;

    test_round_trips();
    test_empty_payloads();
    test_retries();
    test_cancellation();
    test_integrity();
    test_blob_types();
    test_downloads();
    test_append_only_sources();
    test_progress_and_metrics();

    return report_results();
}
