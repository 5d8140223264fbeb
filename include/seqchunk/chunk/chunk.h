// =============================================================================
// seqchunk - Chunk Record
// =============================================================================
// A chunk is one contiguous, independently compressed slice of a sequence:
//
//   id                 "{sequenceIdentifier}_{chunkNumber}" (storage key)
//   sequenceIdentifier owning sequence, e.g. an accession version
//   chunkNumber        zero-based, contiguous within one split
//   payload            Zstd frame of sequence[n*size, n*size+size)
//   rawSize            length of the uncompressed slice
//   checksum           xxHash64 of the uncompressed slice
//
// Chunks are immutable once produced by the splitter.
// =============================================================================

#ifndef SEQCHUNK_CHUNK_CHUNK_H
#define SEQCHUNK_CHUNK_CHUNK_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "seqchunk/common/types.h"

namespace seqchunk::chunk {

// =============================================================================
// Chunk Structure
// =============================================================================

/// @brief One stored slice of a sequence.
struct Chunk {
    /// @brief Storage key, "{sequenceIdentifier}_{chunkNumber}".
    std::string id;

    /// @brief Identifier of the owning sequence.
    std::string sequenceIdentifier;

    /// @brief Zero-based ordinal within the sequence.
    ChunkNumber chunkNumber = 0;

    /// @brief Codec-compressed slice bytes.
    std::vector<std::uint8_t> payload;

    /// @brief Length of the uncompressed slice.
    std::uint64_t rawSize = 0;

    /// @brief xxHash64 of the uncompressed slice.
    Checksum checksum = 0;

    [[nodiscard]] bool operator==(const Chunk& other) const noexcept = default;
};

// =============================================================================
// Chunk Id
// =============================================================================

/// @brief Components of a chunk id.
struct ChunkIdParts {
    std::string sequenceIdentifier;
    ChunkNumber chunkNumber = 0;

    [[nodiscard]] bool operator==(const ChunkIdParts& other) const noexcept = default;
};

/// @brief Derive the chunk id of (identifier, number).
[[nodiscard]] std::string makeChunkId(std::string_view sequenceIdentifier,
                                      ChunkNumber chunkNumber);

/// @brief Split a chunk id at its last separator.
/// @throws FormatError if there is no separator, the identifier is empty, or
///         the suffix is not a decimal chunk number.
[[nodiscard]] ChunkIdParts parseChunkId(std::string_view chunkId);

}  // namespace seqchunk::chunk

#endif  // SEQCHUNK_CHUNK_CHUNK_H
