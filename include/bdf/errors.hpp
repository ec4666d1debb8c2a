#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace bdf {

enum class ErrorCode {
    InvalidFormat,
    UnsupportedVersion,
    CorruptChunk,
    UnexpectedEof,
    TruncatedEntry,
    TruncatedMeta,
    DuplicateHashId,
    UnresolvedHashType,
    RowLengthMismatch,
    TrailingBytes,
    InvalidUtf8,
    InvalidState,
    UnexpectedChunk,
    UnsupportedCompression,
    HashLengthMismatch,
    FieldTooLarge,
    CompressionFailed,
    InvalidArgument
};

std::string_view ErrorCodeName(ErrorCode code);

// Thrown for every violation of the container layout and for API misuse.
// Failures of the underlying byte source or sink are not wrapped.
class FormatError : public std::runtime_error {
public:
    FormatError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}  // namespace bdf
