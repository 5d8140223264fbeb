// =============================================================================
// seqchunk - Chunk Storage Interfaces
// =============================================================================
// Storage collaborators of the chunking core:
// - ChunkReader: fetch stored chunks by id or by sequence identifier
// - ChunkWriter: persist a chunk set, remove a sequence's trailing chunks
//
// A reader returns only what exists; missing ids are simply absent from the
// result. Deciding whether an absence is an error (NotFoundError) is up to
// the caller, typically SequenceStore.
// =============================================================================

#ifndef SEQCHUNK_STORE_CHUNK_STORE_H
#define SEQCHUNK_STORE_CHUNK_STORE_H

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "seqchunk/chunk/chunk.h"

namespace seqchunk::store {

/// @brief A stored record of a sequence that could not be decoded.
struct DamagedRecord {
    ChunkNumber chunkNumber = 0;

    /// @brief Why decoding failed.
    std::string reason;
};

/// @brief Everything stored for one sequence, readable or not.
struct SequenceScan {
    std::vector<chunk::Chunk> chunks;
    std::vector<DamagedRecord> damaged;

    [[nodiscard]] bool empty() const noexcept { return chunks.empty() && damaged.empty(); }
};

/// @brief Read side of a chunk store.
class ChunkReader {
public:
    virtual ~ChunkReader() = default;

    /// @brief Fetch chunks by id.
    /// @return The chunks that exist, in the order of @p ids.
    [[nodiscard]] virtual std::vector<chunk::Chunk> fetch(
        std::span<const std::string> ids) const = 0;

    /// @brief Fetch every stored chunk of a sequence, in no particular order.
    /// @throws FormatError if a stored record cannot be decoded.
    [[nodiscard]] virtual std::vector<chunk::Chunk> fetchSequence(
        std::string_view identifier) const = 0;

    /// @brief Like fetchSequence(), but undecodable records are reported
    ///        instead of thrown.
    /// @note Stores that hold decoded chunks have nothing to report.
    [[nodiscard]] virtual SequenceScan scanSequence(std::string_view identifier) const {
        return SequenceScan{fetchSequence(identifier), {}};
    }

    /// @brief Identifiers of all stored sequences, sorted.
    [[nodiscard]] virtual std::vector<std::string> listSequences() const = 0;
};

/// @brief Write side of a chunk store.
class ChunkWriter {
public:
    virtual ~ChunkWriter() = default;

    /// @brief Persist chunks keyed by their id, replacing existing records.
    virtual void store(std::span<const chunk::Chunk> chunks) = 0;

    /// @brief Remove the chunks of a sequence numbered @p firstChunk or above.
    /// @return Number of chunks removed.
    virtual std::size_t removeChunksFrom(std::string_view identifier, ChunkNumber firstChunk) = 0;
};

/// @brief A store that can both read and write.
class ChunkStore : public ChunkReader, public ChunkWriter {};

}  // namespace seqchunk::store

#endif  // SEQCHUNK_STORE_CHUNK_STORE_H
