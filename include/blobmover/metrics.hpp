#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace blobmover {

/// Transfer counters and latency histograms in a prometheus::Registry.
///
/// One instance may be shared by any number of coordinators (prometheus
/// counters are thread-safe). Export is pull-based: serialize() for an
/// embedding process, write_textfile() for node_exporter pickup.
class TransferMetrics {
public:
    /// @param labels  Constant labels applied to all metrics.
    explicit TransferMetrics(const std::map<std::string, std::string>& labels = {});

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    // --- Recording ---
    void record_transfer(bool upload, bool success, double seconds);
    void record_chunk(bool upload, bool success, uint64_t bytes, double seconds);
    void record_retry() { chunk_retries_->Increment(); }
    void record_integrity_failure() { integrity_failures_->Increment(); }

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& chunks_success() { return *chunks_success_; }
    prometheus::Counter& chunks_failure() { return *chunks_failure_; }
    prometheus::Counter& chunk_retries() { return *chunk_retries_; }
    prometheus::Counter& upload_bytes() { return *upload_bytes_; }
    prometheus::Counter& download_bytes() { return *download_bytes_; }
    prometheus::Counter& integrity_failures() { return *integrity_failures_; }

    // --- Histogram accessors ---
    prometheus::Histogram& chunk_duration() { return *chunk_duration_; }
    prometheus::Histogram& transfer_duration() { return *transfer_duration_; }

    /// Prometheus text exposition format of every family.
    std::string serialize() const;

    /// Write serialize() to `path` via temp file + rename. Returns false (and
    /// logs) on failure; the previous file, if any, is left in place.
    bool write_textfile(const std::filesystem::path& path) const;

private:
    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* chunks_success_;
    prometheus::Counter* chunks_failure_;
    prometheus::Counter* chunk_retries_;
    prometheus::Counter* upload_bytes_;
    prometheus::Counter* download_bytes_;
    prometheus::Counter* integrity_failures_;

    // --- Histograms ---
    prometheus::Histogram* chunk_duration_;
    prometheus::Histogram* transfer_duration_;
};

}  // namespace blobmover
