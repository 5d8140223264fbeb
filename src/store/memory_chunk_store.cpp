// =============================================================================
// seqchunk - In-Memory Chunk Store Implementation
// =============================================================================

#include "seqchunk/store/memory_chunk_store.h"

#include <set>

namespace seqchunk::store {

using chunk::Chunk;

std::vector<Chunk> MemoryChunkStore::fetch(std::span<const std::string> ids) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Chunk> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto it = chunks_.find(id); it != chunks_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::vector<Chunk> MemoryChunkStore::fetchSequence(std::string_view identifier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Chunk> result;
    for (const auto& [id, chunk] : chunks_) {
        if (chunk.sequenceIdentifier == identifier) {
            result.push_back(chunk);
        }
    }
    return result;
}

std::vector<std::string> MemoryChunkStore::listSequences() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> identifiers;
    for (const auto& [id, chunk] : chunks_) {
        identifiers.insert(chunk.sequenceIdentifier);
    }
    return {identifiers.begin(), identifiers.end()};
}

void MemoryChunkStore::store(std::span<const Chunk> chunks) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& chunk : chunks) {
        chunks_.insert_or_assign(chunk.id, chunk);
    }
}

std::size_t MemoryChunkStore::removeChunksFrom(std::string_view identifier,
                                               ChunkNumber firstChunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::erase_if(chunks_, [identifier, firstChunk](const auto& entry) {
        return entry.second.sequenceIdentifier == identifier &&
               entry.second.chunkNumber >= firstChunk;
    });
}

bool MemoryChunkStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.erase(id) > 0;
}

std::size_t MemoryChunkStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

}  // namespace seqchunk::store
