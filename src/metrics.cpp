#include "blobmover/metrics.hpp"
#include "blobmover/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace blobmover {

TransferMetrics::TransferMetrics(const std::map<std::string, std::string>& labels)
    : registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& transfers_family = prometheus::BuildCounter()
        .Name("blobmover_transfers_total")
        .Help("Total transfers completed")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &transfers_family.Add({{"direction", "upload"}, {"result", "success"}});
    uploads_failure_ = &transfers_family.Add({{"direction", "upload"}, {"result", "failure"}});
    downloads_success_ = &transfers_family.Add({{"direction", "download"}, {"result", "success"}});
    downloads_failure_ = &transfers_family.Add({{"direction", "download"}, {"result", "failure"}});

    auto& chunks_family = prometheus::BuildCounter()
        .Name("blobmover_chunks_total")
        .Help("Total chunks finished")
        .Labels(labels)
        .Register(*registry_);
    chunks_success_ = &chunks_family.Add({{"result", "success"}});
    chunks_failure_ = &chunks_family.Add({{"result", "failure"}});

    chunk_retries_ = &prometheus::BuildCounter()
        .Name("blobmover_chunk_retries_total")
        .Help("Total chunk attempts retried after a transient failure")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& bytes_family = prometheus::BuildCounter()
        .Name("blobmover_bytes_total")
        .Help("Total payload bytes transferred")
        .Labels(labels)
        .Register(*registry_);
    upload_bytes_ = &bytes_family.Add({{"direction", "upload"}});
    download_bytes_ = &bytes_family.Add({{"direction", "download"}});

    integrity_failures_ = &prometheus::BuildCounter()
        .Name("blobmover_integrity_failures_total")
        .Help("Total checksum mismatches (per chunk and whole payload)")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    chunk_duration_ = &prometheus::BuildHistogram()
        .Name("blobmover_chunk_duration_seconds")
        .Help("Chunk duration in seconds, retries included")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60});

    transfer_duration_ = &prometheus::BuildHistogram()
        .Name("blobmover_transfer_duration_seconds")
        .Help("Transfer duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});
}

void TransferMetrics::record_transfer(bool upload, bool success, double seconds) {
    if (upload) {
        (success ? uploads_success_ : uploads_failure_)->Increment();
    } else {
        (success ? downloads_success_ : downloads_failure_)->Increment();
    }
    transfer_duration_->Observe(seconds);
}

void TransferMetrics::record_chunk(bool upload, bool success, uint64_t bytes, double seconds) {
    if (success) {
        chunks_success_->Increment();
        (upload ? upload_bytes_ : download_bytes_)->Increment(static_cast<double>(bytes));
    } else {
        chunks_failure_->Increment();
    }
    chunk_duration_->Observe(seconds);
}

std::string TransferMetrics::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

bool TransferMetrics::write_textfile(const std::filesystem::path& path) const {
    auto tmp_path = path;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("metrics: cannot open %s", tmp_path.c_str());
        return false;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) {
        log_error("metrics: write to %s failed", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        log_error("metrics: rename to %s failed: %s", path.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace blobmover
