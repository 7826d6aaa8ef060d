#include "blobmover/transfer/slice_reader.hpp"
#include "blobmover/transfer/errors.hpp"

#include <algorithm>
#include <string>

namespace blobmover {

// --- BoundedSliceReader ---

BoundedSliceReader::BoundedSliceReader(DataSource& source, uint64_t start, uint64_t length)
    : source_(source)
    , start_(start)
    , length_(length) {}

size_t BoundedSliceReader::read(std::span<uint8_t> out) {
    if (exhausted() || out.empty()) return 0;

    auto want = static_cast<size_t>(std::min<uint64_t>(out.size(), remaining()));
    auto window = out.first(want);

    size_t n = source_.seekable() ? source_.read_at(start_ + position_, window)
                                  : source_.read(window);
    position_ += n;
    return n;
}

std::vector<uint8_t> BoundedSliceReader::read_remaining() {
    std::vector<uint8_t> data(static_cast<size_t>(remaining()));
    size_t filled = 0;
    while (filled < data.size()) {
        size_t n = read(std::span<uint8_t>(data).subspan(filled));
        if (n == 0) break;
        filled += n;
    }
    data.resize(filled);
    return data;
}

void BoundedSliceReader::reset() {
    if (position_ == 0) return;
    if (!source_.seekable()) {
        throw TransferError(ErrorKind::NotSeekable,
                            "cannot rewind append-only source to offset " + std::to_string(start_));
    }
    position_ = 0;
}

// --- BoundedSliceWriter ---

BoundedSliceWriter::BoundedSliceWriter(DataSink& sink, uint64_t start, uint64_t length)
    : sink_(sink)
    , start_(start)
    , length_(length) {}

void BoundedSliceWriter::write(std::span<const uint8_t> data) {
    if (position_ + data.size() > length_) {
        throw TransferError(ErrorKind::LocalIo,
                            "received " + std::to_string(position_ + data.size()) +
                            " bytes for a range of " + std::to_string(length_));
    }
    sink_.write_at(start_ + position_, data);
    position_ += data.size();
}

}  // namespace blobmover
