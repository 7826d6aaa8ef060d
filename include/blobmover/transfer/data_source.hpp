#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <vector>

namespace blobmover {

/// Capability of an upload source, chosen explicitly by the caller.
enum class SourceKind {
    Seekable,    // positional reads from any offset, safe across threads
    AppendOnly   // sequential reads only; cannot be repositioned
};

class DataSource {
public:
    virtual ~DataSource() = default;

    virtual SourceKind kind() const = 0;
    bool seekable() const { return kind() == SourceKind::Seekable; }

    /// Total size if known.
    virtual std::optional<uint64_t> size() const = 0;

    /// Positional read of up to out.size() bytes at `offset`; returns bytes read
    /// (0 at end of data). Must not move any shared cursor.
    /// Throws TransferError(NotSeekable) on append-only sources.
    virtual size_t read_at(uint64_t offset, std::span<uint8_t> out) = 0;

    /// Sequential read from the current position.
    virtual size_t read(std::span<uint8_t> out) = 0;
};

/// Caller-owned bytes in memory.
class MemorySource : public DataSource {
public:
    explicit MemorySource(std::span<const uint8_t> data) : data_(data) {}

    SourceKind kind() const override { return SourceKind::Seekable; }
    std::optional<uint64_t> size() const override { return data_.size(); }
    size_t read_at(uint64_t offset, std::span<uint8_t> out) override;
    size_t read(std::span<uint8_t> out) override;

private:
    std::span<const uint8_t> data_;
    uint64_t cursor_ = 0;
};

/// Regular file read with pread(); the descriptor is closed on destruction.
class FileSource : public DataSource {
public:
    explicit FileSource(const std::filesystem::path& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    SourceKind kind() const override { return SourceKind::Seekable; }
    std::optional<uint64_t> size() const override { return size_; }
    size_t read_at(uint64_t offset, std::span<uint8_t> out) override;
    size_t read(std::span<uint8_t> out) override;

private:
    std::filesystem::path path_;
    int fd_ = -1;
    uint64_t size_ = 0;
    uint64_t cursor_ = 0;
};

/// Append-only wrapper over a std::istream (pipes, sockets, decoders).
class StreamSource : public DataSource {
public:
    explicit StreamSource(std::istream& in, std::optional<uint64_t> size = std::nullopt)
        : in_(in), size_(size) {}

    SourceKind kind() const override { return SourceKind::AppendOnly; }
    std::optional<uint64_t> size() const override { return size_; }
    size_t read_at(uint64_t offset, std::span<uint8_t> out) override;
    size_t read(std::span<uint8_t> out) override;

private:
    std::istream& in_;
    std::optional<uint64_t> size_;
};

/// Fixed-size writable download destination. Workers write disjoint ranges
/// concurrently; the sink is committed only after a successful transfer and
/// discarded (marked incomplete) otherwise.
class DataSink {
public:
    virtual ~DataSink() = default;

    /// Size the destination to exactly `size` bytes before any write.
    virtual void preallocate(uint64_t size) = 0;

    /// Write `data` at `offset`. Safe to call concurrently for disjoint ranges.
    virtual void write_at(uint64_t offset, std::span<const uint8_t> data) = 0;

    virtual void commit() = 0;
    virtual void discard() = 0;

    virtual uint64_t size() const = 0;
};

class MemorySink : public DataSink {
public:
    void preallocate(uint64_t size) override;
    void write_at(uint64_t offset, std::span<const uint8_t> data) override;
    void commit() override;
    void discard() override;
    uint64_t size() const override { return data_.size(); }

    const std::vector<uint8_t>& data() const { return data_; }
    bool committed() const { return committed_; }
    bool incomplete() const { return incomplete_; }

private:
    std::vector<uint8_t> data_;
    bool committed_ = false;
    bool incomplete_ = false;
};

/// Writes to "<target>.partial" with pwrite() and renames onto the target on
/// commit. Discard (or destruction without commit) removes the partial file.
class FileSink : public DataSink {
public:
    explicit FileSink(std::filesystem::path target);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void preallocate(uint64_t size) override;
    void write_at(uint64_t offset, std::span<const uint8_t> data) override;
    void commit() override;
    void discard() override;
    uint64_t size() const override { return size_; }

    const std::filesystem::path& target() const { return target_; }
    std::filesystem::path partial_path() const;

private:
    void close_fd();

    std::filesystem::path target_;
    int fd_ = -1;
    uint64_t size_ = 0;
    std::atomic<bool> finished_{false};
};

}  // namespace blobmover
