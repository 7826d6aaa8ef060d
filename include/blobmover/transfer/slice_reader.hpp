#pragma once

#include "blobmover/transfer/data_source.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace blobmover {

/// View of one chunk's byte range [start, start+length) of a shared source.
///
/// Reads go through DataSource::read_at with the reader's own offset, so any
/// number of readers over the same seekable source can run on different
/// threads. Over an append-only source the reader consumes the stream
/// sequentially and can only be reset before the first read.
class BoundedSliceReader {
public:
    BoundedSliceReader(DataSource& source, uint64_t start, uint64_t length);

    /// Read up to out.size() bytes; returns 0 once the range is exhausted.
    size_t read(std::span<uint8_t> out);

    /// Read everything left in the range. A short result means the source
    /// ended before the range did.
    std::vector<uint8_t> read_remaining();

    /// Reposition to the start of the range.
    /// Throws TransferError(NotSeekable) if bytes were already consumed from
    /// an append-only source.
    void reset();

    uint64_t start() const { return start_; }
    uint64_t length() const { return length_; }
    uint64_t position() const { return position_; }
    uint64_t remaining() const { return length_ - position_; }
    bool exhausted() const { return position_ >= length_; }

private:
    DataSource& source_;
    uint64_t start_;
    uint64_t length_;
    uint64_t position_ = 0;
};

/// Destination counterpart: accepts at most `length` bytes, written at
/// start+position of a pre-sized sink.
class BoundedSliceWriter {
public:
    BoundedSliceWriter(DataSink& sink, uint64_t start, uint64_t length);

    /// Throws TransferError(LocalIo) if the write would cross the range end.
    void write(std::span<const uint8_t> data);

    /// Rewind before rewriting the range on a retry.
    void reset() { position_ = 0; }

    uint64_t position() const { return position_; }
    bool complete() const { return position_ == length_; }

private:
    DataSink& sink_;
    uint64_t start_;
    uint64_t length_;
    uint64_t position_ = 0;
};

}  // namespace blobmover
