// =============================================================================
// seqchunk - Chunk Record Implementation
// =============================================================================

#include "seqchunk/chunk/chunk.h"

#include <charconv>

#include <fmt/format.h>

#include "seqchunk/common/error.h"

namespace seqchunk::chunk {

std::string makeChunkId(std::string_view sequenceIdentifier, ChunkNumber chunkNumber) {
    return fmt::format("{}{}{}", sequenceIdentifier, kChunkIdSeparator, chunkNumber);
}

ChunkIdParts parseChunkId(std::string_view chunkId) {
    auto const pos = chunkId.rfind(kChunkIdSeparator);
    if (pos == std::string_view::npos) {
        throw FormatError(fmt::format("Chunk id '{}' has no '{}' separator", chunkId,
                                      kChunkIdSeparator));
    }
    if (pos == 0) {
        throw FormatError(fmt::format("Chunk id '{}' has an empty sequence identifier", chunkId));
    }

    std::string_view const suffix = chunkId.substr(pos + 1);
    ChunkNumber number = 0;
    auto const [ptr, ec] = std::from_chars(suffix.data(), suffix.data() + suffix.size(), number);
    if (suffix.empty() || ec != std::errc{} || ptr != suffix.data() + suffix.size()) {
        throw FormatError(fmt::format("Chunk id '{}' does not end in a chunk number", chunkId));
    }

    return ChunkIdParts{std::string(chunkId.substr(0, pos)), number};
}

}  // namespace seqchunk::chunk
