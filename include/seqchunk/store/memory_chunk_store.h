// =============================================================================
// seqchunk - In-Memory Chunk Store
// =============================================================================

#ifndef SEQCHUNK_STORE_MEMORY_CHUNK_STORE_H
#define SEQCHUNK_STORE_MEMORY_CHUNK_STORE_H

#include <map>
#include <mutex>

#include "seqchunk/store/chunk_store.h"

namespace seqchunk::store {

/// @brief Chunk store holding records in a map keyed by chunk id.
/// @note Thread-safe.
class MemoryChunkStore final : public ChunkStore {
public:
    MemoryChunkStore() = default;

    [[nodiscard]] std::vector<chunk::Chunk> fetch(
        std::span<const std::string> ids) const override;
    [[nodiscard]] std::vector<chunk::Chunk> fetchSequence(
        std::string_view identifier) const override;
    [[nodiscard]] std::vector<std::string> listSequences() const override;

    void store(std::span<const chunk::Chunk> chunks) override;
    std::size_t removeChunksFrom(std::string_view identifier, ChunkNumber firstChunk) override;

    /// @brief Remove one chunk by id.
    /// @return true if a chunk was removed.
    bool remove(const std::string& id);

    /// @brief Number of stored chunks.
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, chunk::Chunk, std::less<>> chunks_;
};

}  // namespace seqchunk::store

#endif  // SEQCHUNK_STORE_MEMORY_CHUNK_STORE_H
