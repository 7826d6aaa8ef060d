#include "blobmover/transfer/chunk_planner.hpp"
#include "blobmover/transfer/errors.hpp"

#include <algorithm>
#include <string>

namespace blobmover {

namespace {

uint64_t ceil_div(uint64_t a, uint64_t b) {
    return (a + b - 1) / b;
}

uint64_t round_up(uint64_t value, uint64_t multiple) {
    return ceil_div(value, multiple) * multiple;
}

}  // namespace

ChunkPlanner::ChunkPlanner(ChunkPolicy policy) : policy_(std::move(policy)) {}

TransferPlan ChunkPlanner::plan(std::optional<int64_t> total_size,
                                bool source_seekable,
                                size_t max_connections) const {
    const uint64_t alignment = std::max<uint64_t>(policy_.alignment, 1);

    if (policy_.chunk_size == 0) {
        throw TransferError(ErrorKind::InvalidSize, "chunk size must be positive");
    }
    if (policy_.chunk_size % alignment != 0) {
        throw TransferError(ErrorKind::InvalidSize,
                            "chunk size " + std::to_string(policy_.chunk_size) +
                            " is not a multiple of " + std::to_string(alignment));
    }
    if (!total_size) {
        throw TransferError(ErrorKind::InvalidSize, "payload size is unknown");
    }
    if (*total_size < 0) {
        throw TransferError(ErrorKind::InvalidSize,
                            "payload size is negative: " + std::to_string(*total_size));
    }

    const uint64_t total = static_cast<uint64_t>(*total_size);
    if (total % alignment != 0) {
        throw TransferError(ErrorKind::InvalidSize,
                            "payload size " + std::to_string(total) +
                            " is not a multiple of " + std::to_string(alignment));
    }

    TransferPlan plan;
    plan.total_size = total;
    plan.policy = policy_;

    // Empty payloads and payloads under the cutoff travel as one chunk
    if (total == 0 || (policy_.allow_single_shot && total <= policy_.single_shot_threshold)) {
        plan.chunks.push_back({0, 0, total});
        plan.chunk_size = total;
        plan.single_shot = policy_.allow_single_shot;
        plan.max_connections = 1;
        return plan;
    }

    if (!source_seekable) {
        throw TransferError(ErrorKind::NotSeekable,
                            "payload of " + std::to_string(total) +
                            " bytes must be chunked but the source cannot be repositioned");
    }

    uint64_t chunk_size = policy_.chunk_size;
    if (policy_.max_chunk_count && *policy_.max_chunk_count > 0 &&
        ceil_div(total, chunk_size) > *policy_.max_chunk_count) {
        chunk_size = round_up(ceil_div(total, *policy_.max_chunk_count), alignment);
    }
    if (chunk_size > constants::MAX_CHUNK_SIZE && chunk_size > policy_.chunk_size) {
        throw TransferError(ErrorKind::InvalidSize,
                            "payload of " + std::to_string(total) +
                            " bytes exceeds the maximum chunk count");
    }

    const uint64_t count = ceil_div(total, chunk_size);
    plan.chunks.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        uint64_t offset = i * chunk_size;
        plan.chunks.push_back({static_cast<size_t>(i), offset, std::min(chunk_size, total - offset)});
    }
    plan.chunk_size = chunk_size;
    plan.max_connections = std::clamp<size_t>(max_connections, 1, plan.chunks.size());
    return plan;
}

}  // namespace blobmover
