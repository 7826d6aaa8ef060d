#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace blobmover {

enum class DigestAlgorithm {
    MD5,      // what the storage service stores and serves as Content-MD5
    SHA256
};

const char* digest_algorithm_name(DigestAlgorithm algorithm);

/// Incremental OpenSSL EVP digest. Move-only; the context is freed on destruction.
class Digest {
public:
    explicit Digest(DigestAlgorithm algorithm);
    ~Digest();

    Digest(Digest&& other) noexcept;
    Digest& operator=(Digest&& other) noexcept;
    Digest(const Digest&) = delete;
    Digest& operator=(const Digest&) = delete;

    void update(std::span<const uint8_t> data);

    /// Finish and return the raw digest bytes. The object may not be updated afterwards.
    std::vector<uint8_t> finish();

    static std::vector<uint8_t> compute(DigestAlgorithm algorithm, std::span<const uint8_t> data);

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

/// Folds chunk payloads into one running digest in sequence-index order,
/// whatever order the chunks complete in. Out-of-order chunks are held until
/// the gap before them is filled. Thread-safe.
class IntegrityAccumulator {
public:
    IntegrityAccumulator(DigestAlgorithm algorithm, size_t expected_chunks);

    IntegrityAccumulator(const IntegrityAccumulator&) = delete;
    IntegrityAccumulator& operator=(const IntegrityAccumulator&) = delete;

    /// Throws TransferError(IncompleteRange) for an index outside the plan or
    /// one that was already ingested.
    void ingest(size_t sequence_index, std::span<const uint8_t> bytes);

    /// Throws TransferError(IncompleteRange) if any index is missing.
    std::vector<uint8_t> finalize();

    DigestAlgorithm algorithm() const { return algorithm_; }
    size_t next_expected() const;
    size_t buffered_chunks() const;
    size_t peak_buffered_chunks() const;
    uint64_t bytes_folded() const;

private:
    DigestAlgorithm algorithm_;
    size_t expected_chunks_;

    mutable std::mutex mutex_;
    Digest digest_;
    size_t next_index_ = 0;
    std::map<size_t, std::vector<uint8_t>> pending_;
    size_t peak_pending_ = 0;
    uint64_t bytes_folded_ = 0;
    bool finalized_ = false;
};

std::string to_hex(std::span<const uint8_t> bytes);

}  // namespace blobmover
