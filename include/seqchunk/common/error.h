// =============================================================================
// seqchunk - Error Handling Framework
// =============================================================================
// Every failure in seqchunk is one ErrorCode. Core operations throw the
// matching SeqChunkException subclass; validation helpers return Result<T>
// and callers unwrap with unwrapOrThrow(). The seqchunk tool exits with the
// numeric ErrorCode of whatever reached main().
// =============================================================================

#ifndef SEQCHUNK_COMMON_ERROR_H
#define SEQCHUNK_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace seqchunk {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Failure categories; the values double as process exit codes.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,

    /// @brief Bad command line or chunking configuration.
    kUsageError = 1,

    /// @brief Store directory or input file could not be read or written.
    kIOError = 2,

    /// @brief Malformed chunk record, chunk id or FASTA input.
    kFormatError = 3,

    /// @brief Decompressed chunk does not match its recorded checksum.
    kChecksumError = 4,

    /// @brief Unknown codec family in a stored chunk record.
    kUnsupportedCodec = 5,

    /// @brief Invalid argument value.
    kInvalidArgument = 6,

    /// @brief A requested chunk has no stored record.
    kNotFound = 7,

    /// @brief Sequence cannot be encoded into a chunk payload.
    kEncodingError = 8,

    /// @brief Chunk payload cannot be restored to sequence text.
    kDecodingError = 9,

    /// @brief Codec failure (invalid, truncated or tampered stream).
    kCodecError = 10,

    /// @brief Merge input spans more than one sequence identifier.
    kInconsistentIdentifier = 11,

    /// @brief Malformed range or chunk size.
    kInvalidRange = 12,

    /// @brief Chunk numbers are not contiguous where contiguity is required.
    kIncompleteChunkSet = 13
};

[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Category label used as the "[...]" prefix of what().
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kChecksumError:
            return "checksum error";
        case ErrorCode::kUnsupportedCodec:
            return "unsupported codec";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kNotFound:
            return "not found";
        case ErrorCode::kEncodingError:
            return "encoding error";
        case ErrorCode::kDecodingError:
            return "decoding error";
        case ErrorCode::kCodecError:
            return "codec error";
        case ErrorCode::kInconsistentIdentifier:
            return "inconsistent identifier";
        case ErrorCode::kInvalidRange:
            return "invalid range";
        case ErrorCode::kIncompleteChunkSet:
            return "incomplete chunk set";
    }
    return "unknown error";
}

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where a failure happened: which sequence, which chunk, which file.
/// @note Built fluently, e.g. ErrorContext(accession).withChunk(3).withFile(path).
struct ErrorContext {
    std::string sequenceIdentifier;
    std::optional<std::uint64_t> chunkNumber;
    std::string filePath;
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string identifier,
                          std::source_location loc = std::source_location::current())
        : sequenceIdentifier(std::move(identifier)), location(loc) {}

    ErrorContext& withChunk(std::uint64_t number) {
        chunkNumber = number;
        return *this;
    }

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    /// @brief "sequence: X, chunk: N, file: P"; fields that are unset are left out.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Root of the seqchunk exception hierarchy.
/// @note what() reads "[category] message (context)".
class SeqChunkException : public std::exception {
public:
    SeqChunkException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    SeqChunkException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief The bare message, without category or context.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Invalid command-line arguments or configuration values (exit code 1).
class UsageError : public SeqChunkException {
public:
    explicit UsageError(std::string message)
        : SeqChunkException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Malformed chunk record, chunk id, or FASTA input (exit code 3).
class FormatError : public SeqChunkException {
public:
    explicit FormatError(std::string message)
        : SeqChunkException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}
};

/// @brief Invalid argument value, e.g. empty identifier or empty merge input.
class InvalidArgumentError : public SeqChunkException {
public:
    explicit InvalidArgumentError(std::string message)
        : SeqChunkException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief A resolved chunk id has no stored record.
/// @note Raised at the storage boundary, never by the core operations.
class NotFoundError : public SeqChunkException {
public:
    explicit NotFoundError(std::string message)
        : SeqChunkException(ErrorCode::kNotFound, std::move(message)) {}

    NotFoundError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kNotFound, std::move(message), std::move(context)) {}
};

/// @brief Sequence cannot be represented as payload bytes or compression failed.
class EncodingError : public SeqChunkException {
public:
    explicit EncodingError(std::string message)
        : SeqChunkException(ErrorCode::kEncodingError, std::move(message)) {}

    EncodingError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kEncodingError, std::move(message), std::move(context)) {}
};

/// @brief Chunk payload cannot be decompressed or decoded.
class DecodingError : public SeqChunkException {
public:
    explicit DecodingError(std::string message)
        : SeqChunkException(ErrorCode::kDecodingError, std::move(message)) {}

    DecodingError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kDecodingError, std::move(message), std::move(context)) {}
};

/// @brief Input is not a valid compressed stream.
class CodecError : public SeqChunkException {
public:
    explicit CodecError(std::string message)
        : SeqChunkException(ErrorCode::kCodecError, std::move(message)) {}

    CodecError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kCodecError, std::move(message), std::move(context)) {}
};

/// @brief Merge input spans more than one sequence identifier.
class InconsistentIdentifierError : public SeqChunkException {
public:
    explicit InconsistentIdentifierError(std::string message)
        : SeqChunkException(ErrorCode::kInconsistentIdentifier, std::move(message)) {}

    InconsistentIdentifierError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kInconsistentIdentifier, std::move(message), std::move(context)) {}
};

/// @brief Range with start >= end, a zero chunk size, or too many chunks.
class InvalidRangeError : public SeqChunkException {
public:
    explicit InvalidRangeError(std::string message)
        : SeqChunkException(ErrorCode::kInvalidRange, std::move(message)) {}

    InvalidRangeError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kInvalidRange, std::move(message), std::move(context)) {}
};

/// @brief Chunk numbers have gaps or duplicates where contiguity is required.
class IncompleteChunkSetError : public SeqChunkException {
public:
    explicit IncompleteChunkSetError(std::string message)
        : SeqChunkException(ErrorCode::kIncompleteChunkSet, std::move(message)) {}

    IncompleteChunkSetError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kIncompleteChunkSet, std::move(message), std::move(context)) {}
};

/// @brief Filesystem or stream failure, optionally carrying the OS error.
class IOError : public SeqChunkException {
public:
    explicit IOError(std::string message)
        : SeqChunkException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    IOError(std::string message, std::error_code ec)
        : SeqChunkException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : SeqChunkException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                            std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief A decompressed chunk does not hash to the XXH64 stored in its record.
class ChecksumError : public SeqChunkException {
public:
    explicit ChecksumError(std::string message)
        : SeqChunkException(ErrorCode::kChecksumError, std::move(message)) {}

    ChecksumError(std::uint64_t expected, std::uint64_t actual, ErrorContext context)
        : SeqChunkException(ErrorCode::kChecksumError,
                            formatChecksumMismatch(expected, actual),
                            std::move(context)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint64_t> expected() const noexcept { return expected_; }

    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

private:
    static std::string formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual);

    std::optional<std::uint64_t> expected_;
    std::optional<std::uint64_t> actual_;
};

/// @brief A chunk record names a codec this build cannot decode.
class UnsupportedCodecError : public SeqChunkException {
public:
    explicit UnsupportedCodecError(std::string message)
        : SeqChunkException(ErrorCode::kUnsupportedCodec, std::move(message)) {}

    UnsupportedCodecError(std::string message, ErrorContext context)
        : SeqChunkException(ErrorCode::kUnsupportedCodec, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief The error half of Result<T>: a code and a message, no context.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    explicit Error(const SeqChunkException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Raise the SeqChunkException subclass that corresponds to code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Value of @p result, or the exception matching its error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Run @p func, turning a thrown exception into an error Result.
/// @note Exceptions outside the hierarchy are reported as kIOError.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const SeqChunkException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace seqchunk

#endif  // SEQCHUNK_COMMON_ERROR_H
