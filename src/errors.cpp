#include "bdf/errors.hpp"

namespace bdf {

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidFormat:
            return "InvalidFormat";
        case ErrorCode::UnsupportedVersion:
            return "UnsupportedVersion";
        case ErrorCode::CorruptChunk:
            return "CorruptChunk";
        case ErrorCode::UnexpectedEof:
            return "UnexpectedEof";
        case ErrorCode::TruncatedEntry:
            return "TruncatedEntry";
        case ErrorCode::TruncatedMeta:
            return "TruncatedMeta";
        case ErrorCode::DuplicateHashId:
            return "DuplicateHashId";
        case ErrorCode::UnresolvedHashType:
            return "UnresolvedHashType";
        case ErrorCode::RowLengthMismatch:
            return "RowLengthMismatch";
        case ErrorCode::TrailingBytes:
            return "TrailingBytes";
        case ErrorCode::InvalidUtf8:
            return "InvalidUtf8";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::UnexpectedChunk:
            return "UnexpectedChunk";
        case ErrorCode::UnsupportedCompression:
            return "UnsupportedCompression";
        case ErrorCode::HashLengthMismatch:
            return "HashLengthMismatch";
        case ErrorCode::FieldTooLarge:
            return "FieldTooLarge";
        case ErrorCode::CompressionFailed:
            return "CompressionFailed";
        case ErrorCode::InvalidArgument:
            return "InvalidArgument";
    }
    return "Unknown";
}

FormatError::FormatError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + message), code_(code) {}

}  // namespace bdf
