#pragma once

#include <stdexcept>
#include <string>

namespace blobmover {

/// Terminal error kinds of a transfer.
enum class ErrorKind {
    None,
    InvalidSize,          // planning: negative/unknown size, misaligned page ranges
    NotSeekable,          // planning: chunking needs a repositionable source
    TransientTransport,   // timeout, 5xx, throttling; retried per policy
    FatalTransport,       // auth/permission/client errors; never retried
    Integrity,            // checksum mismatch
    IncompleteRange,      // accumulator invariant violated; indicates a bug
    Cancelled,            // cooperative cancellation observed
    LocalIo               // caller-supplied file source/sink failed
};

const char* error_kind_name(ErrorKind kind);

/// Stages of a single transfer operation.
enum class TransferStage {
    Planning,
    InFlight,
    Validating,
    Committing,
    Done,
    Failed
};

const char* stage_name(TransferStage stage);

/// Thrown by transfer components; the coordinator converts it into a
/// failed TransferResult.
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace blobmover
