#include "blobmover/transfer/integrity.hpp"
#include "blobmover/transfer/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace blobmover {

const char* digest_algorithm_name(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::MD5: return "md5";
        case DigestAlgorithm::SHA256: return "sha256";
    }
    return "unknown";
}

// --- Digest ---

Digest::Digest(DigestAlgorithm algorithm) {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    const EVP_MD* md = (algorithm == DigestAlgorithm::MD5) ? EVP_md5() : EVP_sha256();
    if (EVP_DigestInit_ex(ctx_, md, nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Digest::~Digest() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

Digest::Digest(Digest&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

Digest& Digest::operator=(Digest&& other) noexcept {
    if (this != &other) {
        if (ctx_) EVP_MD_CTX_free(ctx_);
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void Digest::update(std::span<const uint8_t> data) {
    if (data.empty()) return;
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::vector<uint8_t> Digest::finish() {
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, out.data(), &len) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    out.resize(len);
    return out;
}

std::vector<uint8_t> Digest::compute(DigestAlgorithm algorithm, std::span<const uint8_t> data) {
    Digest digest(algorithm);
    digest.update(data);
    return digest.finish();
}

// --- IntegrityAccumulator ---

IntegrityAccumulator::IntegrityAccumulator(DigestAlgorithm algorithm, size_t expected_chunks)
    : algorithm_(algorithm)
    , expected_chunks_(expected_chunks)
    , digest_(algorithm) {}

void IntegrityAccumulator::ingest(size_t sequence_index, std::span<const uint8_t> bytes) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (finalized_) {
        throw TransferError(ErrorKind::IncompleteRange, "chunk ingested after finalize");
    }
    if (sequence_index >= expected_chunks_) {
        throw TransferError(ErrorKind::IncompleteRange,
                            "chunk index " + std::to_string(sequence_index) +
                            " outside plan of " + std::to_string(expected_chunks_));
    }
    if (sequence_index < next_index_ || pending_.count(sequence_index) != 0) {
        throw TransferError(ErrorKind::IncompleteRange,
                            "chunk " + std::to_string(sequence_index) + " ingested twice");
    }

    if (sequence_index != next_index_) {
        pending_.emplace(sequence_index, std::vector<uint8_t>(bytes.begin(), bytes.end()));
        peak_pending_ = std::max(peak_pending_, pending_.size());
        return;
    }

    digest_.update(bytes);
    bytes_folded_ += bytes.size();
    ++next_index_;

    // Drain whatever became contiguous
    auto it = pending_.begin();
    while (it != pending_.end() && it->first == next_index_) {
        digest_.update(it->second);
        bytes_folded_ += it->second.size();
        ++next_index_;
        it = pending_.erase(it);
    }
}

std::vector<uint8_t> IntegrityAccumulator::finalize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finalized_) {
        throw TransferError(ErrorKind::IncompleteRange, "accumulator already finalized");
    }
    if (next_index_ != expected_chunks_) {
        throw TransferError(ErrorKind::IncompleteRange,
                            "chunk " + std::to_string(next_index_) + " of " +
                            std::to_string(expected_chunks_) + " was never ingested");
    }
    finalized_ = true;
    return digest_.finish();
}

size_t IntegrityAccumulator::next_expected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_index_;
}

size_t IntegrityAccumulator::buffered_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t IntegrityAccumulator::peak_buffered_chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_pending_;
}

uint64_t IntegrityAccumulator::bytes_folded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_folded_;
}

std::string to_hex(std::span<const uint8_t> bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

}  // namespace blobmover
