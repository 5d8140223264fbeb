// =============================================================================
// seqchunk - Chunk Splitter Implementation
// =============================================================================

#include "seqchunk/chunk/chunk_splitter.h"

#include <algorithm>

#include <fmt/format.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"

namespace seqchunk::chunk {

std::size_t findUnencodable(std::string_view text, TextEncoding encoding) noexcept {
    if (encoding == TextEncoding::kBinary) {
        return std::string_view::npos;
    }
    auto const it = std::find_if(text.begin(), text.end(), [](char c) {
        return static_cast<unsigned char>(c) >= 0x80;
    });
    return it == text.end() ? std::string_view::npos
                            : static_cast<std::size_t>(it - text.begin());
}

std::vector<Chunk> ChunkSplitter::split(std::string_view sequenceIdentifier,
                                        std::string_view sequence, ChunkSize size) const {
    if (sequenceIdentifier.empty()) {
        throw InvalidArgumentError("Sequence identifier must not be empty");
    }
    if (size == 0) {
        throw InvalidRangeError("Chunk size must be positive",
                                ErrorContext(std::string(sequenceIdentifier)));
    }

    if (auto const bad = findUnencodable(sequence, config_.encoding);
        bad != std::string_view::npos) {
        throw EncodingError(
            fmt::format("Byte 0x{:02x} at position {} is not valid {}",
                        static_cast<unsigned char>(sequence[bad]), bad,
                        textEncodingToString(config_.encoding)),
            ErrorContext(std::string(sequenceIdentifier)).withChunk(bad / size));
    }

    std::size_t const count = expectedChunkCount(sequence.size(), size);
    std::vector<Chunk> chunks(count);

    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, count),
        [&](const tbb::blocked_range<std::size_t>& range) {
            for (std::size_t i = range.begin(); i != range.end(); ++i) {
                std::string_view const window = sequence.substr(i * size, size);
                auto const bytes = codec::asBytes(window);

                Chunk& chunk = chunks[i];
                chunk.id = makeChunkId(sequenceIdentifier, i);
                chunk.sequenceIdentifier = std::string(sequenceIdentifier);
                chunk.chunkNumber = i;
                chunk.rawSize = window.size();
                chunk.checksum = codec::checksum(bytes);
                try {
                    chunk.payload = codec_.compress(bytes);
                } catch (const CodecError& e) {
                    throw EncodingError(e.message(),
                                        ErrorContext(std::string(sequenceIdentifier)).withChunk(i));
                }
            }
        });

    SEQCHUNK_LOG_DEBUG("Split {} ({} bytes) into {} chunks of {} bytes", sequenceIdentifier,
                       sequence.size(), count, size);
    return chunks;
}

}  // namespace seqchunk::chunk
