#pragma once

#include "blobmover/core/cancellation.hpp"
#include "blobmover/transfer/chunk_planner.hpp"
#include "blobmover/transfer/errors.hpp"
#include "blobmover/transfer/retry_policy.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace blobmover {

/// Result of one request attempt for one chunk.
struct AttemptResult {
    ErrorKind error = ErrorKind::None;
    int http_status = 0;
    std::string message;
    uint64_t bytes = 0;
    std::string checksum;  // base64 digest of the chunk, when computed

    bool ok() const { return error == ErrorKind::None; }

    static AttemptResult success(uint64_t bytes, std::string checksum = {}) {
        AttemptResult r;
        r.bytes = bytes;
        r.checksum = std::move(checksum);
        return r;
    }
    static AttemptResult failure(ErrorKind kind, int http_status, std::string message) {
        AttemptResult r;
        r.error = kind;
        r.http_status = http_status;
        r.message = std::move(message);
        return r;
    }
};

/// Final state of one chunk, produced by exactly one worker.
struct WorkerOutcome {
    size_t index = 0;
    bool success = false;
    uint64_t bytes_transferred = 0;
    std::string checksum_fragment;
    ErrorKind error = ErrorKind::None;
    int http_status = 0;
    std::string error_message;
    uint32_t attempts = 0;
    std::chrono::milliseconds retry_wait{0};
    std::chrono::milliseconds duration{0};
};

/// The work for one chunk. A job is created once per chunk and retried in
/// place: reset() is called before every attempt after the first.
class ChunkJob {
public:
    virtual ~ChunkJob() = default;

    /// Issue the chunk's request once.
    virtual AttemptResult attempt() = 0;

    /// Reposition the job's reader/writer to the start of its range.
    virtual void reset() = 0;

    /// Bytes carried by the last successful attempt (folded into the digest).
    virtual std::span<const uint8_t> payload() const = 0;
};

using ChunkJobFactory = std::function<std::unique_ptr<ChunkJob>(const ChunkDescriptor&)>;

/// Called on the worker thread after a chunk succeeds. A TransferError thrown
/// here fails the chunk (and the transfer) with that error kind.
using ChunkCompletionFn = std::function<void(const WorkerOutcome&, ChunkJob&)>;

/// Called for every retry the policy grants.
using RetryObserver = std::function<void(const RetryContext&, const RetryDecision&)>;

struct PoolResult {
    bool success = false;
    ErrorKind error = ErrorKind::None;
    std::string error_message;

    // Outcomes of every chunk that was started, ordered by index
    std::vector<WorkerOutcome> outcomes;
    std::optional<WorkerOutcome> first_failure;

    size_t chunks_succeeded = 0;
    uint64_t bytes_transferred = 0;
    uint32_t retries = 0;
};

/// Runs a plan's chunks on at most plan.max_connections threads.
///
/// Workers pull the next unassigned index from a shared counter, so no index
/// is ever handed to two workers. Claims are windowed: index i is claimed only
/// once i < lowest unfinished index + worker count, where a chunk is finished
/// after its completion callback returns. A stalled chunk therefore holds back
/// new claims instead of letting completed chunks pile up behind it.
///
/// The first fatal chunk error (or caller cancellation) stops the pool from
/// starting new chunks and interrupts retry waits and window waits; requests
/// already on the wire finish on their own. A pool runs once.
class TransferWorkerPool {
public:
    TransferWorkerPool(const TransferPlan& plan,
                       const RetryPolicy& retry,
                       std::shared_ptr<CancellationToken> cancellation = nullptr);

    TransferWorkerPool(const TransferWorkerPool&) = delete;
    TransferWorkerPool& operator=(const TransferWorkerPool&) = delete;

    void set_retry_observer(RetryObserver observer) { retry_observer_ = std::move(observer); }

    PoolResult run(const ChunkJobFactory& factory, const ChunkCompletionFn& on_complete = {});

    size_t worker_count() const;

private:
    void worker_loop(const ChunkJobFactory& factory, const ChunkCompletionFn& on_complete);
    std::optional<size_t> claim_next();
    WorkerOutcome run_chunk(const ChunkDescriptor& chunk,
                            const ChunkJobFactory& factory,
                            const ChunkCompletionFn& on_complete);
    void record(WorkerOutcome outcome);

    bool caller_cancelled() const;
    bool stopping() const;

    /// Sleep for `wait`, waking early on abort or caller cancellation.
    /// Returns true if interrupted.
    bool interruptible_wait(std::chrono::milliseconds wait) const;

    const TransferPlan& plan_;
    const RetryPolicy& retry_;
    std::shared_ptr<CancellationToken> cancellation_;
    RetryObserver retry_observer_;

    std::atomic<bool> ran_{false};
    CancellationToken abort_;  // raised internally on the first fatal error

    std::mutex mutex_;
    std::condition_variable window_cv_;
    size_t next_chunk_ = 0;
    size_t low_water_ = 0;  // lowest index not yet finished
    std::vector<bool> finished_;
    std::vector<WorkerOutcome> outcomes_;
    std::optional<WorkerOutcome> first_failure_;
    bool saw_cancellation_ = false;
    uint32_t retries_ = 0;
};

}  // namespace blobmover
