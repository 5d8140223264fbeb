// =============================================================================
// seqchunk - Chunk Splitter
// =============================================================================
// Divides a sequence into ordered, fixed-size chunks.
//
// Window i covers sequence[i*size, i*size+size) (the last window may be
// shorter) and becomes chunk number i with id "{identifier}_{i}". Each
// window is compressed independently; windows are compressed in parallel
// and returned in window order.
//
// An empty sequence yields no chunks.
// =============================================================================

#ifndef SEQCHUNK_CHUNK_CHUNK_SPLITTER_H
#define SEQCHUNK_CHUNK_CHUNK_SPLITTER_H

#include <cstddef>
#include <string_view>
#include <vector>

#include "seqchunk/chunk/chunk.h"
#include "seqchunk/codec/zstd_codec.h"
#include "seqchunk/common/types.h"

namespace seqchunk::chunk {

/// @brief Configuration for ChunkSplitter.
struct SplitterConfig {
    /// @brief Text encoding the sequence must satisfy.
    TextEncoding encoding = TextEncoding::kAscii;

    /// @brief Payload codec settings.
    codec::CodecConfig codec;
};

/// @brief Splits sequences into compressed chunks.
/// @note Stateless apart from its configuration; safe to share between threads.
class ChunkSplitter {
public:
    explicit ChunkSplitter(SplitterConfig config = {}) noexcept
        : config_(config), codec_(config.codec) {}

    /// @brief Split a sequence into chunks of at most @p size bytes.
    /// @param sequenceIdentifier Owning sequence identifier (non-empty).
    /// @param sequence Sequence text (may be empty).
    /// @param size Chunk size (> 0).
    /// @return Chunks numbered 0..k-1, k = ceil(len / size).
    /// @throws InvalidArgumentError if the identifier is empty.
    /// @throws InvalidRangeError if size is 0.
    /// @throws EncodingError if the sequence violates the configured encoding
    ///         or a window fails to compress.
    [[nodiscard]] std::vector<Chunk> split(std::string_view sequenceIdentifier,
                                           std::string_view sequence, ChunkSize size) const;

    [[nodiscard]] const SplitterConfig& config() const noexcept { return config_; }

private:
    SplitterConfig config_;
    codec::ZstdCodec codec_;
};

/// @brief Number of chunks a sequence of @p length splits into.
[[nodiscard]] constexpr std::size_t expectedChunkCount(std::size_t length,
                                                       ChunkSize size) noexcept {
    return size == 0 ? 0 : static_cast<std::size_t>((length + size - 1) / size);
}

/// @brief Find the first byte that violates @p encoding.
/// @return Its position, or std::string_view::npos when the text is valid.
[[nodiscard]] std::size_t findUnencodable(std::string_view text, TextEncoding encoding) noexcept;

}  // namespace seqchunk::chunk

#endif  // SEQCHUNK_CHUNK_CHUNK_SPLITTER_H
