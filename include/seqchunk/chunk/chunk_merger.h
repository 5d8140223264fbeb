// =============================================================================
// seqchunk - Chunk Merger
// =============================================================================
// Reassembles a sequence from an unordered collection of its chunks.
//
// Steps:
// 1. Reject an empty collection and any chunk whose identifier differs from
//    the others (every chunk is compared).
// 2. Stable-sort by chunk number and apply the configured GapPolicy.
// 3. Decompress each payload, verify its checksum, decode, concatenate.
//
// With GapPolicy::kIgnore a collection with missing chunk numbers merges into
// a sequence that silently lacks the missing interior bytes. Callers that
// need a complete sequence select kRequireComplete; ranged reads over a
// chunk sub-range select kRequireContiguous.
// =============================================================================

#ifndef SEQCHUNK_CHUNK_CHUNK_MERGER_H
#define SEQCHUNK_CHUNK_CHUNK_MERGER_H

#include <span>
#include <string>
#include <vector>

#include "seqchunk/chunk/chunk.h"
#include "seqchunk/codec/zstd_codec.h"
#include "seqchunk/common/types.h"

namespace seqchunk::chunk {

/// @brief Configuration for ChunkMerger.
struct MergerConfig {
    /// @brief Encoding the decompressed bytes must satisfy.
    TextEncoding encoding = TextEncoding::kAscii;

    /// @brief Contiguity requirement on chunk numbers.
    GapPolicy gapPolicy = GapPolicy::kIgnore;

    /// @brief Compare each decompressed slice with its recorded checksum and size.
    bool verifyChecksums = true;

    /// @brief Payload codec settings.
    codec::CodecConfig codec;
};

/// @brief Result of a merge.
struct MergedSequence {
    std::string sequenceIdentifier;
    std::string sequence;

    [[nodiscard]] bool operator==(const MergedSequence& other) const noexcept = default;
};

/// @brief Merges chunks back into a sequence.
/// @note Stateless apart from its configuration; safe to share between threads.
class ChunkMerger {
public:
    explicit ChunkMerger(MergerConfig config = {}) noexcept
        : config_(config), codec_(config.codec) {}

    /// @brief Merge chunks of one sequence.
    /// @param chunks Chunks in any order.
    /// @return Identifier and concatenated sequence in chunk-number order.
    /// @throws InvalidArgumentError if @p chunks is empty.
    /// @throws InconsistentIdentifierError if identifiers differ.
    /// @throws IncompleteChunkSetError if the gap policy is violated.
    /// @throws DecodingError if a payload cannot be decompressed or decoded.
    /// @throws ChecksumError if a slice does not match its checksum.
    [[nodiscard]] MergedSequence merge(std::span<const Chunk> chunks) const;

    [[nodiscard]] const MergerConfig& config() const noexcept { return config_; }

private:
    MergerConfig config_;
    codec::ZstdCodec codec_;
};

/// @brief Chunk numbers absent from first..last of a sorted collection.
/// @param sortedNumbers Chunk numbers in ascending order.
[[nodiscard]] std::vector<ChunkNumber> findGaps(std::span<const ChunkNumber> sortedNumbers);

}  // namespace seqchunk::chunk

#endif  // SEQCHUNK_CHUNK_CHUNK_MERGER_H
