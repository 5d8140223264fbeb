// =============================================================================
// seqchunk - Sequence Store Implementation
// =============================================================================

#include "seqchunk/store/sequence_store.h"

#include <algorithm>
#include <unordered_set>

#include <fmt/format.h>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"

namespace seqchunk::store {

using chunk::Chunk;

namespace {

config::ChunkingConfig validated(config::ChunkingConfig config) {
    unwrapOrThrow(config.validate());
    return config;
}

std::vector<ChunkNumber> sortedNumbers(const std::vector<Chunk>& chunks) {
    std::vector<ChunkNumber> numbers;
    numbers.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        numbers.push_back(chunk.chunkNumber);
    }
    std::sort(numbers.begin(), numbers.end());
    return numbers;
}

}  // namespace

SequenceStore::SequenceStore(config::ChunkingConfig config, ChunkReader& reader,
                             ChunkWriter& writer)
    : config_(validated(std::move(config))),
      reader_(reader),
      writer_(writer),
      splitter_(config_.splitterConfig()) {}

IngestSummary SequenceStore::ingest(std::string_view identifier, std::string_view sequence) {
    auto const chunks = splitter_.split(identifier, sequence, config_.chunkSize());

    IngestSummary summary;
    summary.sequenceIdentifier = std::string(identifier);
    summary.chunkCount = chunks.size();
    summary.rawBytes = sequence.size();
    for (const auto& chunk : chunks) {
        summary.compressedBytes += chunk.payload.size();
    }

    // The previous version stays readable until store() succeeds. Only the
    // tail of a longer previous version is removed afterwards.
    writer_.store(chunks);
    summary.staleChunks = writer_.removeChunksFrom(identifier, chunks.size());

    SEQCHUNK_LOG_DEBUG("Ingested {}: {} bytes in {} chunks ({} compressed, {} stale removed)",
                       identifier, summary.rawBytes, summary.chunkCount,
                       summary.compressedBytes, summary.staleChunks);
    return summary;
}

std::vector<Chunk> SequenceStore::fetchAll(std::string_view identifier) const {
    auto chunks = reader_.fetchSequence(identifier);
    if (chunks.empty()) {
        throw NotFoundError(fmt::format("Sequence '{}' is not stored", identifier),
                            ErrorContext(std::string(identifier)));
    }
    return chunks;
}

chunk::MergedSequence SequenceStore::fetch(std::string_view identifier) const {
    auto const chunks = fetchAll(identifier);
    chunk::ChunkMerger const merger(config_.mergerConfig(GapPolicy::kRequireComplete));
    return merger.merge(chunks);
}

RangeResult SequenceStore::fetchRange(const chunk::RangeRequest& request) const {
    ChunkSize const size = config_.chunkSize();
    RangeResult result;
    result.resolution = chunk::resolve(request, size);
    const auto& resolution = result.resolution;

    auto const chunks = reader_.fetch(resolution.partitions);
    if (chunks.size() != resolution.partitions.size()) {
        std::unordered_set<std::string_view> present;
        for (const auto& chunk : chunks) {
            present.insert(chunk.id);
        }

        // The chunk after a range ending exactly on the sequence end does not exist
        // and contributes no bytes.
        std::size_t const last = resolution.partitions.size() - 1;
        bool const trailingOptional = request.end % size == 0;
        for (std::size_t i = 0; i < resolution.partitions.size(); ++i) {
            const auto& id = resolution.partitions[i];
            if (present.contains(id) || (i == last && trailingOptional)) {
                continue;
            }
            throw NotFoundError(fmt::format("Chunk '{}' is not stored", id),
                                ErrorContext(request.sequenceIdentifier)
                                    .withChunk(resolution.firstChunk + i));
        }
    }

    chunk::ChunkMerger const merger(config_.mergerConfig(GapPolicy::kRequireContiguous));
    auto const merged = merger.merge(chunks);
    if (merged.sequence.size() < resolution.localEnd) {
        throw InvalidRangeError(
            fmt::format("Range [{}, {}) runs past the end of '{}' at {}", request.start,
                        request.end, request.sequenceIdentifier,
                        resolution.firstChunk * size + merged.sequence.size()),
            ErrorContext(request.sequenceIdentifier));
    }

    result.sequence = std::string(chunk::sliceResolved(merged.sequence, resolution));
    SEQCHUNK_LOG_DEBUG("Read {}[{}, {}) from {} chunks", request.sequenceIdentifier,
                       request.start, request.end, chunks.size());
    return result;
}

SequenceInfo SequenceStore::describe(std::string_view identifier) const {
    auto const chunks = fetchAll(identifier);
    auto const numbers = sortedNumbers(chunks);

    SequenceInfo info;
    info.sequenceIdentifier = std::string(identifier);
    info.chunkCount = chunks.size();
    info.firstChunk = numbers.front();
    info.lastChunk = numbers.back();
    for (const auto& chunk : chunks) {
        info.rawBytes += chunk.rawSize;
        info.compressedBytes += chunk.payload.size();
    }
    return info;
}

VerifyReport SequenceStore::verify(std::string_view identifier) const {
    auto const scan = reader_.scanSequence(identifier);
    if (scan.empty()) {
        throw NotFoundError(fmt::format("Sequence '{}' is not stored", identifier),
                            ErrorContext(std::string(identifier)));
    }
    const auto& chunks = scan.chunks;

    // Undecodable records still occupy their chunk number.
    auto numbers = sortedNumbers(chunks);
    for (const auto& damaged : scan.damaged) {
        numbers.push_back(damaged.chunkNumber);
    }
    std::sort(numbers.begin(), numbers.end());

    VerifyReport report;
    report.info.sequenceIdentifier = std::string(identifier);
    report.info.chunkCount = numbers.size();
    report.info.firstChunk = numbers.front();
    report.info.lastChunk = numbers.back();

    for (ChunkNumber n = 0; n < numbers.front(); ++n) {
        report.missingChunks.push_back(n);
    }
    auto const gaps = chunk::findGaps(numbers);
    report.missingChunks.insert(report.missingChunks.end(), gaps.begin(), gaps.end());
    for (std::size_t i = 1; i < numbers.size(); ++i) {
        if (numbers[i] == numbers[i - 1] &&
            (report.duplicateChunks.empty() || report.duplicateChunks.back() != numbers[i])) {
            report.duplicateChunks.push_back(numbers[i]);
        }
    }

    for (const auto& damaged : scan.damaged) {
        SEQCHUNK_LOG_WARNING("Chunk {} of {} is unreadable: {}", damaged.chunkNumber, identifier,
                             damaged.reason);
        report.corruptChunks.push_back(damaged.chunkNumber);
    }

    chunk::ChunkMerger const merger(config_.mergerConfig(GapPolicy::kIgnore));
    for (const auto& chunk : chunks) {
        report.info.rawBytes += chunk.rawSize;
        report.info.compressedBytes += chunk.payload.size();
        try {
            static_cast<void>(merger.merge(std::span<const Chunk>(&chunk, 1)));
        } catch (const ChecksumError& e) {
            SEQCHUNK_LOG_WARNING("{}", e.what());
            report.corruptChunks.push_back(chunk.chunkNumber);
        } catch (const DecodingError& e) {
            SEQCHUNK_LOG_WARNING("{}", e.what());
            report.corruptChunks.push_back(chunk.chunkNumber);
        }
    }
    std::sort(report.corruptChunks.begin(), report.corruptChunks.end());

    SEQCHUNK_LOG_DEBUG("Verified {}: {} chunks, {} missing, {} corrupt", identifier,
                       report.info.chunkCount, report.missingChunks.size(),
                       report.corruptChunks.size());
    return report;
}

}  // namespace seqchunk::store
