// =============================================================================
// seqchunk - Range Resolver Implementation
// =============================================================================

#include "seqchunk/chunk/range_resolver.h"

#include <algorithm>

#include <fmt/format.h>

#include "seqchunk/chunk/chunk.h"
#include "seqchunk/common/error.h"

namespace seqchunk::chunk {

RangeResolution resolve(const RangeRequest& request, ChunkSize size) {
    if (size == 0) {
        throw InvalidRangeError("Chunk size must be positive",
                                ErrorContext(request.sequenceIdentifier));
    }
    if (request.start >= request.end) {
        throw InvalidRangeError(
            fmt::format("Range [{}, {}) is empty or reversed", request.start, request.end),
            ErrorContext(request.sequenceIdentifier));
    }

    ChunkNumber const idxStart = request.start / size;
    ChunkNumber const idxEnd = request.end / size;
    if (idxEnd - idxStart >= kMaxRangePartitions) {
        throw InvalidRangeError(
            fmt::format("Range [{}, {}) spans {} chunks of {} bytes, limit is {}", request.start,
                        request.end, idxEnd - idxStart, size, kMaxRangePartitions),
            ErrorContext(request.sequenceIdentifier));
    }
    std::uint64_t const count = idxEnd - idxStart + 1;

    RangeResolution resolution;
    resolution.sequenceIdentifier = request.sequenceIdentifier;
    resolution.firstChunk = idxStart;
    resolution.lastChunk = idxEnd;
    resolution.partitions.reserve(count);
    for (std::uint64_t i = 0; i < count; ++i) {
        resolution.partitions.push_back(makeChunkId(request.sequenceIdentifier, idxStart + i));
    }

    // end is re-expressed relative to the first fetched chunk
    resolution.localStart = request.start % size;
    resolution.localEnd = request.end % size + size * (count - 1);
    resolution.strand = request.strand;
    return resolution;
}

std::string_view sliceResolved(std::string_view merged,
                               const RangeResolution& resolution) noexcept {
    auto const begin = std::min<std::size_t>(resolution.localStart, merged.size());
    auto const end = std::min<std::size_t>(resolution.localEnd, merged.size());
    return merged.substr(begin, end - begin);
}

}  // namespace seqchunk::chunk
