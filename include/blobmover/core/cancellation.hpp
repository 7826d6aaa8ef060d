#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace blobmover {

/// Cooperative cancellation flag shared between a caller and the workers of a
/// transfer. Workers poll is_cancelled() at chunk and retry boundaries and use
/// wait_for() for backoff sleeps so that cancel() cuts the sleep short.
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool is_cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

    /// Sleep for up to `duration`. Returns true if cancelled before or during the wait.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

}  // namespace blobmover
