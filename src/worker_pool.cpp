#include "blobmover/transfer/worker_pool.hpp"
#include "blobmover/core/log.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace blobmover {

namespace {

// Longest uninterrupted sleep while waiting out a backoff; bounds how late a
// caller cancellation is noticed.
constexpr std::chrono::milliseconds kWaitSlice{50};

}  // namespace

TransferWorkerPool::TransferWorkerPool(const TransferPlan& plan,
                                       const RetryPolicy& retry,
                                       std::shared_ptr<CancellationToken> cancellation)
    : plan_(plan)
    , retry_(retry)
    , cancellation_(std::move(cancellation)) {}

size_t TransferWorkerPool::worker_count() const {
    if (plan_.chunks.empty()) return 0;
    return std::clamp<size_t>(plan_.max_connections, 1, plan_.chunks.size());
}

bool TransferWorkerPool::caller_cancelled() const {
    return cancellation_ && cancellation_->is_cancelled();
}

bool TransferWorkerPool::stopping() const {
    return abort_.is_cancelled() || caller_cancelled();
}

bool TransferWorkerPool::interruptible_wait(std::chrono::milliseconds wait) const {
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        if (stopping()) return true;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice);
        if (abort_.wait_for(slice)) return true;
    }
}

PoolResult TransferWorkerPool::run(const ChunkJobFactory& factory,
                                   const ChunkCompletionFn& on_complete) {
    if (ran_.exchange(true)) {
        throw std::logic_error("TransferWorkerPool::run called twice");
    }

    const size_t workers = worker_count();
    finished_.assign(plan_.chunks.size(), false);
    if (workers <= 1) {
        worker_loop(factory, on_complete);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads.emplace_back([this, &factory, &on_complete] {
                worker_loop(factory, on_complete);
            });
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    PoolResult result;
    std::lock_guard<std::mutex> lock(mutex_);
    result.outcomes = std::move(outcomes_);
    std::sort(result.outcomes.begin(), result.outcomes.end(),
              [](const WorkerOutcome& a, const WorkerOutcome& b) { return a.index < b.index; });

    for (const auto& o : result.outcomes) {
        if (o.success) {
            ++result.chunks_succeeded;
            result.bytes_transferred += o.bytes_transferred;
        }
    }
    result.retries = retries_;
    result.first_failure = first_failure_;

    if (first_failure_) {
        result.error = first_failure_->error;
        result.error_message = "chunk " + std::to_string(first_failure_->index) + " failed after " +
                               std::to_string(first_failure_->attempts) + " attempt(s): " +
                               first_failure_->error_message;
    } else if (saw_cancellation_ || result.chunks_succeeded < plan_.chunks.size()) {
        // Nothing failed, so anything left undone was cut short by cancellation
        result.error = ErrorKind::Cancelled;
        result.error_message = "transfer cancelled after " +
                               std::to_string(result.chunks_succeeded) + " of " +
                               std::to_string(plan_.chunks.size()) + " chunks";
    } else {
        result.success = true;
    }
    return result;
}

void TransferWorkerPool::worker_loop(const ChunkJobFactory& factory,
                                     const ChunkCompletionFn& on_complete) {
    while (auto index = claim_next()) {
        record(run_chunk(plan_.chunks[*index], factory, on_complete));
    }
}

std::optional<size_t> TransferWorkerPool::claim_next() {
    const size_t window = worker_count();
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        // Safe point: never start a new chunk once the transfer is stopping
        if (stopping()) {
            if (caller_cancelled()) saw_cancellation_ = true;
            return std::nullopt;
        }
        if (next_chunk_ >= plan_.chunks.size()) return std::nullopt;
        if (next_chunk_ < low_water_ + window) return next_chunk_++;

        // Caller cancellation does not notify window_cv_, so poll in slices
        window_cv_.wait_for(lock, kWaitSlice);
    }
}

WorkerOutcome TransferWorkerPool::run_chunk(const ChunkDescriptor& chunk,
                                            const ChunkJobFactory& factory,
                                            const ChunkCompletionFn& on_complete) {
    WorkerOutcome outcome;
    outcome.index = chunk.index;
    auto start = std::chrono::steady_clock::now();

    RetryContext context;
    context.chunk_index = chunk.index;

    std::unique_ptr<ChunkJob> job;
    try {
        job = factory(chunk);

        while (true) {
            if (context.attempt > 0) {
                job->reset();
            }

            AttemptResult attempt = job->attempt();
            ++context.attempt;

            if (attempt.ok()) {
                outcome.success = true;
                outcome.bytes_transferred = attempt.bytes;
                outcome.checksum_fragment = std::move(attempt.checksum);
                break;
            }

            context.last_error = attempt.error;
            context.http_status = attempt.http_status;
            context.message = attempt.message;

            RetryDecision decision = retry_.should_retry(context);
            if (!decision.retry) {
                outcome.error = attempt.error;
                outcome.http_status = attempt.http_status;
                outcome.error_message = attempt.message;
                break;
            }

            log_warn("chunk %zu attempt %u failed (%s: %s), retrying in %lld ms",
                     chunk.index, context.attempt, error_kind_name(attempt.error),
                     attempt.message.c_str(), static_cast<long long>(decision.wait.count()));
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++retries_;
            }
            if (retry_observer_) {
                retry_observer_(context, decision);
            }

            // Safe point between attempts
            if (interruptible_wait(decision.wait)) {
                outcome.error = ErrorKind::Cancelled;
                outcome.http_status = attempt.http_status;
                outcome.error_message = caller_cancelled()
                    ? "cancelled while waiting to retry"
                    : "abandoned after another chunk failed";
                break;
            }
        }

        if (outcome.success && on_complete) {
            on_complete(outcome, *job);
        }
    } catch (const TransferError& e) {
        outcome.success = false;
        outcome.error = e.kind();
        outcome.error_message = e.what();
    } catch (const std::exception& e) {
        outcome.success = false;
        outcome.error = ErrorKind::FatalTransport;
        outcome.error_message = e.what();
    }

    outcome.attempts = context.attempt;
    outcome.retry_wait = context.elapsed_wait;
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return outcome;
}

void TransferWorkerPool::record(WorkerOutcome outcome) {
    bool raise_abort = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome.success) {
            finished_[outcome.index] = true;
            while (low_water_ < finished_.size() && finished_[low_water_]) {
                ++low_water_;
            }
        } else {
            if (outcome.error == ErrorKind::Cancelled) {
                if (caller_cancelled()) saw_cancellation_ = true;
            } else if (!first_failure_) {
                first_failure_ = outcome;
                raise_abort = true;
                log_error("chunk %zu failed (%s): %s", outcome.index,
                          error_kind_name(outcome.error), outcome.error_message.c_str());
            }
        }
        outcomes_.push_back(std::move(outcome));
    }
    if (raise_abort) {
        abort_.cancel();
    }
    window_cv_.notify_all();
}

}  // namespace blobmover
