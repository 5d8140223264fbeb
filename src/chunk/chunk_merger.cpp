// =============================================================================
// seqchunk - Chunk Merger Implementation
// =============================================================================

#include "seqchunk/chunk/chunk_merger.h"

#include <algorithm>
#include <numeric>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "seqchunk/chunk/chunk_splitter.h"
#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"

namespace seqchunk::chunk {

namespace {

void checkGapPolicy(const std::vector<const Chunk*>& sorted, GapPolicy policy,
                    const std::string& identifier) {
    if (policy == GapPolicy::kIgnore) {
        return;
    }

    ChunkNumber const first = sorted.front()->chunkNumber;
    if (policy == GapPolicy::kRequireComplete && first != 0) {
        throw IncompleteChunkSetError(
            fmt::format("Chunk set starts at chunk {} instead of 0 (gap policy: {})", first,
                        gapPolicyToString(policy)),
            ErrorContext(identifier).withChunk(0));
    }

    for (std::size_t i = 1; i < sorted.size(); ++i) {
        ChunkNumber const prev = sorted[i - 1]->chunkNumber;
        ChunkNumber const curr = sorted[i]->chunkNumber;
        if (curr == prev) {
            throw IncompleteChunkSetError(fmt::format("Duplicate chunk {} (gap policy: {})", curr,
                                                      gapPolicyToString(policy)),
                                          ErrorContext(identifier).withChunk(curr));
        }
        if (curr != prev + 1) {
            throw IncompleteChunkSetError(
                fmt::format("Chunks {} to {} are missing (gap policy: {})", prev + 1, curr - 1,
                            gapPolicyToString(policy)),
                ErrorContext(identifier).withChunk(prev + 1));
        }
    }
}

}  // namespace

std::vector<ChunkNumber> findGaps(std::span<const ChunkNumber> sortedNumbers) {
    std::vector<ChunkNumber> gaps;
    for (std::size_t i = 1; i < sortedNumbers.size(); ++i) {
        for (ChunkNumber n = sortedNumbers[i - 1] + 1; n < sortedNumbers[i]; ++n) {
            gaps.push_back(n);
        }
    }
    return gaps;
}

MergedSequence ChunkMerger::merge(std::span<const Chunk> chunks) const {
    if (chunks.empty()) {
        throw InvalidArgumentError("Cannot merge an empty chunk collection");
    }

    const std::string& identifier = chunks.front().sequenceIdentifier;
    for (const auto& chunk : chunks) {
        if (chunk.sequenceIdentifier != identifier) {
            throw InconsistentIdentifierError(
                fmt::format("Chunk '{}' belongs to '{}', expected '{}'", chunk.id,
                            chunk.sequenceIdentifier, identifier),
                ErrorContext(identifier).withChunk(chunk.chunkNumber));
        }
    }

    std::vector<const Chunk*> sorted;
    sorted.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        sorted.push_back(&chunk);
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const Chunk* a, const Chunk* b) {
        return a->chunkNumber < b->chunkNumber;
    });

    checkGapPolicy(sorted, config_.gapPolicy, identifier);

    std::vector<std::vector<std::uint8_t>> slices(sorted.size());
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, sorted.size()),
        [&](const tbb::blocked_range<std::size_t>& range) {
            for (std::size_t i = range.begin(); i != range.end(); ++i) {
                const Chunk& chunk = *sorted[i];
                try {
                    slices[i] = codec_.decompress(chunk.payload);
                } catch (const CodecError& e) {
                    throw DecodingError(
                        fmt::format("Chunk '{}': {}", chunk.id, e.message()),
                        ErrorContext(identifier).withChunk(chunk.chunkNumber));
                }

                if (config_.verifyChecksums) {
                    if (slices[i].size() != chunk.rawSize) {
                        throw ChecksumError(
                            fmt::format("Chunk '{}' restored {} bytes, expected {}", chunk.id,
                                        slices[i].size(), chunk.rawSize),
                            ErrorContext(identifier).withChunk(chunk.chunkNumber));
                    }
                    Checksum const actual = codec::checksum(slices[i]);
                    if (actual != chunk.checksum) {
                        throw ChecksumError(chunk.checksum, actual,
                                            ErrorContext(identifier).withChunk(chunk.chunkNumber));
                    }
                }
            }
        });

    std::size_t const total = std::accumulate(
        slices.begin(), slices.end(), std::size_t{0},
        [](std::size_t sum, const auto& slice) { return sum + slice.size(); });

    MergedSequence merged;
    merged.sequenceIdentifier = identifier;
    merged.sequence.reserve(total);
    for (std::size_t i = 0; i < slices.size(); ++i) {
        std::string_view const text(reinterpret_cast<const char*>(slices[i].data()),
                                    slices[i].size());
        if (auto const bad = findUnencodable(text, config_.encoding);
            bad != std::string_view::npos) {
            throw DecodingError(
                fmt::format("Chunk '{}' byte 0x{:02x} at offset {} is not valid {}",
                            sorted[i]->id, static_cast<unsigned char>(text[bad]), bad,
                            textEncodingToString(config_.encoding)),
                ErrorContext(identifier).withChunk(sorted[i]->chunkNumber));
        }
        merged.sequence.append(text);
    }

    SEQCHUNK_LOG_DEBUG("Merged {} chunks of {} into {} bytes", sorted.size(), identifier,
                       merged.sequence.size());
    return merged;
}

}  // namespace seqchunk::chunk
