// =============================================================================
// seqchunk - Range Resolver
// =============================================================================
// Maps a global half-open range [start, end) of a sequence onto the chunks
// that hold it and onto local offsets within the merge of those chunks.
//
//   idxStart   = start / size
//   idxEnd     = end / size
//   partitions = "{id}_{i}" for i in idxStart..=idxEnd
//   localStart = start % size
//   localEnd   = end % size + size * (partitions - 1)
//
// Merging exactly the listed partitions in chunk-number order and slicing
// [localStart, localEnd) yields sequence[start, end). The resolver never
// sees the stored data: when end lies past the sequence the listed
// partitions may not exist, which the storage layer reports.
// =============================================================================

#ifndef SEQCHUNK_CHUNK_RANGE_RESOLVER_H
#define SEQCHUNK_CHUNK_RANGE_RESOLVER_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "seqchunk/common/types.h"

namespace seqchunk::chunk {

/// @brief Upper bound on the partitions one request may list.
inline constexpr std::uint64_t kMaxRangePartitions = 1U << 20;

/// @brief Request for sequence[start, end).
struct RangeRequest {
    std::string sequenceIdentifier;
    SeqPos start = 0;
    SeqPos end = 0;

    /// @brief Opaque orientation metadata, returned unchanged.
    std::optional<std::string> strand;

    [[nodiscard]] bool operator==(const RangeRequest& other) const noexcept = default;
};

/// @brief Chunks to fetch and where the request lies in their merge.
struct RangeResolution {
    std::string sequenceIdentifier;

    /// @brief Chunk ids in chunk-number order.
    std::vector<std::string> partitions;

    ChunkNumber firstChunk = 0;
    ChunkNumber lastChunk = 0;

    /// @brief Offset of the request start within the merged partitions.
    SeqPos localStart = 0;

    /// @brief Offset one past the request end within the merged partitions.
    SeqPos localEnd = 0;

    /// @brief Copied from the request.
    std::optional<std::string> strand;

    [[nodiscard]] std::size_t partitionCount() const noexcept { return partitions.size(); }

    [[nodiscard]] bool operator==(const RangeResolution& other) const noexcept = default;
};

/// @brief Resolve a range request against chunks of @p size bytes.
/// @throws InvalidRangeError if size is 0, start >= end, or the range spans
///         more than kMaxRangePartitions chunks.
[[nodiscard]] RangeResolution resolve(const RangeRequest& request, ChunkSize size);

/// @brief Slice the requested bytes out of the merged partitions.
/// @note The slice is clamped to @p merged; a trailing partition that does
///       not exist (end == sequence length on a chunk boundary) is harmless.
[[nodiscard]] std::string_view sliceResolved(std::string_view merged,
                                             const RangeResolution& resolution) noexcept;

}  // namespace seqchunk::chunk

#endif  // SEQCHUNK_CHUNK_RANGE_RESOLVER_H
