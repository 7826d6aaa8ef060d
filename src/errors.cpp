#include "blobmover/transfer/errors.hpp"

namespace blobmover {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::InvalidSize: return "InvalidSizeError";
        case ErrorKind::NotSeekable: return "NotSeekableError";
        case ErrorKind::TransientTransport: return "TransientTransportError";
        case ErrorKind::FatalTransport: return "FatalTransportError";
        case ErrorKind::Integrity: return "IntegrityError";
        case ErrorKind::IncompleteRange: return "IncompleteRangeError";
        case ErrorKind::Cancelled: return "CancelledError";
        case ErrorKind::LocalIo: return "LocalIoError";
    }
    return "Unknown";
}

const char* stage_name(TransferStage stage) {
    switch (stage) {
        case TransferStage::Planning: return "Planning";
        case TransferStage::InFlight: return "InFlight";
        case TransferStage::Validating: return "Validating";
        case TransferStage::Committing: return "Committing";
        case TransferStage::Done: return "Done";
        case TransferStage::Failed: return "Failed";
    }
    return "Unknown";
}

}  // namespace blobmover
