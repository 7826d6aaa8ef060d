#include "blobmover/transfer/data_source.hpp"
#include "blobmover/transfer/errors.hpp"
#include "blobmover/core/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace blobmover {

namespace {

std::string errno_message(const std::string& what, const std::filesystem::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

}  // namespace

// --- MemorySource ---

size_t MemorySource::read_at(uint64_t offset, std::span<uint8_t> out) {
    if (offset >= data_.size()) return 0;
    size_t n = std::min<uint64_t>(out.size(), data_.size() - offset);
    std::memcpy(out.data(), data_.data() + offset, n);
    return n;
}

size_t MemorySource::read(std::span<uint8_t> out) {
    size_t n = read_at(cursor_, out);
    cursor_ += n;
    return n;
}

// --- FileSource ---

FileSource::FileSource(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw TransferError(ErrorKind::LocalIo, errno_message("cannot open", path));
    }
    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        auto msg = errno_message("cannot stat", path);
        ::close(fd_);
        throw TransferError(ErrorKind::LocalIo, msg);
    }
    size_ = static_cast<uint64_t>(st.st_size);
}

FileSource::~FileSource() {
    if (fd_ >= 0) ::close(fd_);
}

size_t FileSource::read_at(uint64_t offset, std::span<uint8_t> out) {
    size_t total = 0;
    while (total < out.size()) {
        ssize_t n = ::pread(fd_, out.data() + total, out.size() - total,
                            static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransferError(ErrorKind::LocalIo, errno_message("read failed on", path_));
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }
    return total;
}

size_t FileSource::read(std::span<uint8_t> out) {
    size_t n = read_at(cursor_, out);
    cursor_ += n;
    return n;
}

// --- StreamSource ---

size_t StreamSource::read_at(uint64_t offset, std::span<uint8_t> out) {
    (void)offset;
    (void)out;
    throw TransferError(ErrorKind::NotSeekable, "stream source does not support positional reads");
}

size_t StreamSource::read(std::span<uint8_t> out) {
    if (!in_.good()) return 0;
    in_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (in_.bad()) {
        throw TransferError(ErrorKind::LocalIo, "stream read failed");
    }
    return static_cast<size_t>(in_.gcount());
}

// --- MemorySink ---

void MemorySink::preallocate(uint64_t size) {
    data_.assign(size, 0);
    committed_ = false;
    incomplete_ = false;
}

void MemorySink::write_at(uint64_t offset, std::span<const uint8_t> data) {
    if (offset + data.size() > data_.size()) {
        throw TransferError(ErrorKind::LocalIo,
                            "write of " + std::to_string(data.size()) + " bytes at " +
                            std::to_string(offset) + " exceeds destination size " +
                            std::to_string(data_.size()));
    }
    if (!data.empty()) {
        std::memcpy(data_.data() + offset, data.data(), data.size());
    }
}

void MemorySink::commit() {
    committed_ = true;
    incomplete_ = false;
}

void MemorySink::discard() {
    data_.clear();
    committed_ = false;
    incomplete_ = true;
}

// --- FileSink ---

FileSink::FileSink(std::filesystem::path target) : target_(std::move(target)) {}

FileSink::~FileSink() {
    if (!finished_.load() && fd_ >= 0) {
        discard();
    }
    close_fd();
}

std::filesystem::path FileSink::partial_path() const {
    auto p = target_;
    p += ".partial";
    return p;
}

void FileSink::close_fd() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void FileSink::preallocate(uint64_t size) {
    close_fd();
    auto path = partial_path();
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw TransferError(ErrorKind::LocalIo, errno_message("cannot create", path));
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
        throw TransferError(ErrorKind::LocalIo, errno_message("cannot size", path));
    }
    size_ = size;
    finished_ = false;
}

void FileSink::write_at(uint64_t offset, std::span<const uint8_t> data) {
    if (fd_ < 0) {
        throw TransferError(ErrorKind::LocalIo, "destination not preallocated: " + target_.string());
    }
    if (offset + data.size() > size_) {
        throw TransferError(ErrorKind::LocalIo,
                            "write at " + std::to_string(offset) + " exceeds destination size " +
                            std::to_string(size_));
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::pwrite(fd_, data.data() + written, data.size() - written,
                             static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransferError(ErrorKind::LocalIo, errno_message("write failed on", partial_path()));
        }
        written += static_cast<size_t>(n);
    }
}

void FileSink::commit() {
    if (fd_ >= 0 && ::fsync(fd_) != 0) {
        throw TransferError(ErrorKind::LocalIo, errno_message("fsync failed on", partial_path()));
    }
    close_fd();
    std::error_code ec;
    std::filesystem::rename(partial_path(), target_, ec);
    if (ec) {
        throw TransferError(ErrorKind::LocalIo,
                            "cannot rename " + partial_path().string() + ": " + ec.message());
    }
    finished_ = true;
}

void FileSink::discard() {
    close_fd();
    std::error_code ec;
    std::filesystem::remove(partial_path(), ec);
    if (ec) {
        log_warn("cannot remove incomplete download %s: %s",
                 partial_path().c_str(), ec.message().c_str());
    }
    finished_ = true;
}

}  // namespace blobmover
