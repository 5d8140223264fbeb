// =============================================================================
// seqchunk - Error Handling Framework Implementation
// =============================================================================

#include "seqchunk/common/error.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <string>
#include <vector>

namespace seqchunk {

// =============================================================================
// Message Formatting
// =============================================================================

std::string ErrorContext::format() const {
    std::vector<std::string> parts;
    if (!sequenceIdentifier.empty()) {
        parts.push_back(fmt::format("sequence: {}", sequenceIdentifier));
    }
    if (chunkNumber.has_value()) {
        parts.push_back(fmt::format("chunk: {}", *chunkNumber));
    }
    if (!filePath.empty()) {
        parts.push_back(fmt::format("file: {}", filePath));
    }
    if (parts.empty()) {
        return {};
    }

    std::string text = fmt::format("{}", fmt::join(parts, ", "));
#ifndef NDEBUG
    text += fmt::format(" (at {}:{})", location.file_name(), location.line());
#endif
    return text;
}

void SeqChunkException::formatWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (context_.has_value()) {
        if (auto const where = context_->format(); !where.empty()) {
            what_ += fmt::format(" ({})", where);
        }
    }
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (errno {})", message, ec.message(), ec.value());
}

std::string ChecksumError::formatChecksumMismatch(std::uint64_t expected, std::uint64_t actual) {
    return fmt::format("XXH64 mismatch: record says {:016x}, payload hashes to {:016x}", expected,
                       actual);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kFormatError:
            throw FormatError(message_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_);
        case ErrorCode::kUnsupportedCodec:
            throw UnsupportedCodecError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kNotFound:
            throw NotFoundError(message_);
        case ErrorCode::kEncodingError:
            throw EncodingError(message_);
        case ErrorCode::kDecodingError:
            throw DecodingError(message_);
        case ErrorCode::kCodecError:
            throw CodecError(message_);
        case ErrorCode::kInconsistentIdentifier:
            throw InconsistentIdentifierError(message_);
        case ErrorCode::kInvalidRange:
            throw InvalidRangeError(message_);
        case ErrorCode::kIncompleteChunkSet:
            throw IncompleteChunkSetError(message_);
        case ErrorCode::kSuccess:
            break;
    }
    throw SeqChunkException(code_, message_);
}

}  // namespace seqchunk
