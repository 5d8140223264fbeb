// =============================================================================
// seqchunk - Common Type Definitions
// =============================================================================
// Core type definitions for the seqchunk library.
//
// This module defines:
// - ChunkNumber, ChunkSize, SeqPos, Checksum: type aliases
// - StoreProfile: backing-store profiles and their chunk size policy
// - TextEncoding: how sequence text maps to payload bytes
// - GapPolicy: chunk-number contiguity checks applied by the merger
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef SEQCHUNK_COMMON_TYPES_H
#define SEQCHUNK_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace seqchunk {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Zero-based ordinal of a chunk within its sequence.
using ChunkNumber = std::uint64_t;

/// @brief Number of sequence bytes per chunk.
using ChunkSize = std::uint64_t;

/// @brief Zero-based position within a sequence.
using SeqPos = std::uint64_t;

/// @brief Checksum values (xxHash64).
using Checksum = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Separator between sequence identifier and chunk number in a chunk id.
inline constexpr char kChunkIdSeparator = '_';

/// @brief Chunk size for document stores (16 MB document limit).
inline constexpr ChunkSize kDocumentStoreChunkSize = 300'000;

/// @brief Chunk size for row-oriented table stores (64 KB property limit).
inline constexpr ChunkSize kTableStoreChunkSize = 60'000;

/// @brief Default Zstd compression level.
inline constexpr int kDefaultZstdLevel = 3;

/// @brief Minimum Zstd compression level accepted by the configuration.
inline constexpr int kMinZstdLevel = 1;

/// @brief Maximum Zstd compression level accepted by the configuration.
inline constexpr int kMaxZstdLevel = 22;

// =============================================================================
// Store Profile Enumeration
// =============================================================================

/// @brief Backing-store profile.
/// @note Each profile carries a fixed chunk size (see chunkSizeFor()).
enum class StoreProfile : std::uint8_t {
    /// @brief Document store (MongoDB).
    kMongoDb = 0,

    /// @brief Row-oriented table store (Azure Table Storage).
    kAzureTable = 1,

    /// @brief Relational table store (MariaDB/MySQL).
    kMariaDb = 2,

    /// @brief Embedded relational store (SQLite).
    kSqlite = 3
};

/// @brief Convert StoreProfile to string representation.
[[nodiscard]] constexpr std::string_view storeProfileToString(StoreProfile profile) noexcept {
    switch (profile) {
        case StoreProfile::kMongoDb:
            return "mongodb";
        case StoreProfile::kAzureTable:
            return "azure";
        case StoreProfile::kMariaDb:
            return "mariadb";
        case StoreProfile::kSqlite:
            return "sqlite";
    }
    return "unknown";
}

/// @brief Chunk size policy of a store profile.
[[nodiscard]] constexpr ChunkSize chunkSizeFor(StoreProfile profile) noexcept {
    switch (profile) {
        case StoreProfile::kMongoDb:
            return kDocumentStoreChunkSize;
        case StoreProfile::kAzureTable:
        case StoreProfile::kMariaDb:
        case StoreProfile::kSqlite:
            return kTableStoreChunkSize;
    }
    return kTableStoreChunkSize;
}

// =============================================================================
// Text Encoding Enumeration
// =============================================================================

/// @brief Mapping between sequence text and payload bytes.
enum class TextEncoding : std::uint8_t {
    /// @brief 7-bit ASCII; bytes >= 0x80 cannot be encoded or decoded.
    kAscii = 0,

    /// @brief Arbitrary bytes, no validation.
    kBinary = 1
};

/// @brief Convert TextEncoding to string representation.
[[nodiscard]] constexpr std::string_view textEncodingToString(TextEncoding encoding) noexcept {
    switch (encoding) {
        case TextEncoding::kAscii:
            return "ascii";
        case TextEncoding::kBinary:
            return "binary";
    }
    return "unknown";
}

// =============================================================================
// Gap Policy Enumeration
// =============================================================================

/// @brief Contiguity requirement applied to merge input.
enum class GapPolicy : std::uint8_t {
    /// @brief Concatenate whatever is given in chunk-number order.
    /// @note Gaps silently drop interior bytes; duplicates are repeated.
    kIgnore = 0,

    /// @brief Chunk numbers must be first..first+n-1 without duplicates.
    kRequireContiguous = 1,

    /// @brief As kRequireContiguous, and the first chunk number must be 0.
    kRequireComplete = 2
};

/// @brief Convert GapPolicy to string representation.
[[nodiscard]] constexpr std::string_view gapPolicyToString(GapPolicy policy) noexcept {
    switch (policy) {
        case GapPolicy::kIgnore:
            return "ignore";
        case GapPolicy::kRequireContiguous:
            return "contiguous";
        case GapPolicy::kRequireComplete:
            return "complete";
    }
    return "unknown";
}

static_assert(sizeof(StoreProfile) == 1, "StoreProfile must be 1 byte");
static_assert(sizeof(TextEncoding) == 1, "TextEncoding must be 1 byte");
static_assert(sizeof(GapPolicy) == 1, "GapPolicy must be 1 byte");
static_assert(chunkSizeFor(StoreProfile::kMongoDb) == 300'000);
static_assert(chunkSizeFor(StoreProfile::kAzureTable) == 60'000);

}  // namespace seqchunk

#endif  // SEQCHUNK_COMMON_TYPES_H
