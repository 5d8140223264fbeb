// =============================================================================
// seqchunk - Sequence Store
// =============================================================================
// Facade tying the chunking core to a chunk store:
//
//   ingest     split -> remove previous chunk set -> store
//   fetch      fetch all chunks -> merge (complete set required)
//   fetchRange resolve -> fetch partitions -> merge (contiguous) -> slice
//   verify     decompress and check every stored chunk, report gaps
//
// The chunk size comes from the ChunkingConfig and is fixed for the lifetime
// of the facade. Reading a sequence with a different size than it was
// written with yields wrong ranges; the store does not record the size.
// =============================================================================

#ifndef SEQCHUNK_STORE_SEQUENCE_STORE_H
#define SEQCHUNK_STORE_SEQUENCE_STORE_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "seqchunk/chunk/chunk_merger.h"
#include "seqchunk/chunk/chunk_splitter.h"
#include "seqchunk/chunk/range_resolver.h"
#include "seqchunk/config/chunking_config.h"
#include "seqchunk/store/chunk_store.h"

namespace seqchunk::store {

/// @brief Outcome of an ingest.
struct IngestSummary {
    std::string sequenceIdentifier;
    std::size_t chunkCount = 0;
    std::uint64_t rawBytes = 0;
    std::uint64_t compressedBytes = 0;
    /// @brief Trailing chunks of a longer previous version that were removed.
    std::size_t staleChunks = 0;

    /// @brief Compressed bytes per raw byte (0 for an empty sequence).
    [[nodiscard]] double compressionRatio() const noexcept {
        return rawBytes == 0 ? 0.0
                             : static_cast<double>(compressedBytes) / static_cast<double>(rawBytes);
    }
};

/// @brief Result of a ranged read.
struct RangeResult {
    chunk::RangeResolution resolution;
    std::string sequence;
};

/// @brief Stored footprint of one sequence.
struct SequenceInfo {
    std::string sequenceIdentifier;
    std::size_t chunkCount = 0;
    std::uint64_t rawBytes = 0;
    std::uint64_t compressedBytes = 0;
    ChunkNumber firstChunk = 0;
    ChunkNumber lastChunk = 0;
};

/// @brief Integrity report of one stored sequence.
struct VerifyReport {
    SequenceInfo info;
    /// @brief Chunk numbers missing from 0..lastChunk.
    std::vector<ChunkNumber> missingChunks;
    /// @brief Chunk numbers whose record or payload failed to decode or verify.
    std::vector<ChunkNumber> corruptChunks;
    /// @brief Chunk numbers stored more than once.
    std::vector<ChunkNumber> duplicateChunks;

    [[nodiscard]] bool ok() const noexcept {
        return missingChunks.empty() && corruptChunks.empty() && duplicateChunks.empty();
    }
};

/// @brief Sequence-level access to a chunk store.
class SequenceStore {
public:
    /// @throws UsageError if @p config is invalid.
    SequenceStore(config::ChunkingConfig config, ChunkReader& reader, ChunkWriter& writer);

    /// @throws UsageError if @p config is invalid.
    SequenceStore(config::ChunkingConfig config, ChunkStore& store)
        : SequenceStore(std::move(config), store, store) {}

    /// @brief Split and store a sequence, replacing any previous version.
    IngestSummary ingest(std::string_view identifier, std::string_view sequence);

    /// @brief Reassemble a whole sequence.
    /// @throws NotFoundError if no chunk of @p identifier is stored.
    /// @throws IncompleteChunkSetError if stored chunks do not form 0..k-1.
    [[nodiscard]] chunk::MergedSequence fetch(std::string_view identifier) const;

    /// @brief Read sequence[start, end).
    /// @throws InvalidRangeError if start >= end or the range runs past the
    ///         stored sequence.
    /// @throws NotFoundError if a chunk the range needs is not stored.
    [[nodiscard]] RangeResult fetchRange(const chunk::RangeRequest& request) const;

    /// @brief Check every stored chunk of a sequence.
    /// @throws NotFoundError if no chunk of @p identifier is stored.
    [[nodiscard]] VerifyReport verify(std::string_view identifier) const;

    /// @brief Stored footprint of a sequence, without decompressing.
    /// @throws NotFoundError if no chunk of @p identifier is stored.
    [[nodiscard]] SequenceInfo describe(std::string_view identifier) const;

    /// @brief Identifiers of all stored sequences.
    [[nodiscard]] std::vector<std::string> listSequences() const { return reader_.listSequences(); }

    [[nodiscard]] const config::ChunkingConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] std::vector<chunk::Chunk> fetchAll(std::string_view identifier) const;

    config::ChunkingConfig config_;
    ChunkReader& reader_;
    ChunkWriter& writer_;
    chunk::ChunkSplitter splitter_;
};

}  // namespace seqchunk::store

#endif  // SEQCHUNK_STORE_SEQUENCE_STORE_H
