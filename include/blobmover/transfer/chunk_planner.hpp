#pragma once

#include "blobmover/core/constants.hpp"
#include "blobmover/net/http.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace blobmover {

/// One contiguous byte range of a payload, transferred as one logical unit.
struct ChunkDescriptor {
    size_t index = 0;      // 0-based; defines logical order
    uint64_t offset = 0;
    uint64_t length = 0;

    uint64_t end() const { return offset + length; }
    net::ByteRange range() const { return {offset, length}; }
};

/// How a payload is cut into chunks.
struct ChunkPolicy {
    uint64_t chunk_size = constants::DEFAULT_CHUNK_SIZE;
    uint64_t single_shot_threshold = constants::DEFAULT_SINGLE_SHOT_THRESHOLD;
    std::optional<size_t> max_chunk_count = constants::DEFAULT_MAX_CHUNK_COUNT;

    // Chunk size and total size must be multiples of this (512 for page blobs)
    uint64_t alignment = 1;

    // False when the remote kind has no single-request form (page, append)
    bool allow_single_shot = true;
};

/// Immutable result of planning one transfer.
struct TransferPlan {
    std::vector<ChunkDescriptor> chunks;
    uint64_t total_size = 0;
    ChunkPolicy policy;            // as requested
    uint64_t chunk_size = 0;       // as applied (may be raised by max_chunk_count)
    size_t max_connections = 1;    // clamped to [1, chunk count]
    bool single_shot = false;

    size_t chunk_count() const { return chunks.size(); }
};

class ChunkPlanner {
public:
    explicit ChunkPlanner(ChunkPolicy policy);

    /// Plan a transfer of `total_size` bytes (nullopt = unknown).
    ///
    /// Throws TransferError(InvalidSize) for negative or unknown sizes, a zero
    /// chunk size or misaligned sizes, and TransferError(NotSeekable) when the
    /// payload is above the single-shot cutoff but the source cannot be
    /// repositioned.
    TransferPlan plan(std::optional<int64_t> total_size,
                      bool source_seekable,
                      size_t max_connections) const;

    const ChunkPolicy& policy() const { return policy_; }

private:
    ChunkPolicy policy_;
};

}  // namespace blobmover
