// =============================================================================
// seqchunk - Zstd Chunk Codec
// =============================================================================
// Lossless payload codec for chunk slices.
//
// Every payload is a single Zstd frame that records its content size and a
// content checksum, so truncated, tampered or foreign payloads are rejected
// by decompress() instead of yielding garbage. An empty slice still
// produces a (tiny) valid frame.
//
// The codec is stateless: compression contexts are created per call, so a
// single ZstdCodec may be shared between threads.
// =============================================================================

#ifndef SEQCHUNK_CODEC_ZSTD_CODEC_H
#define SEQCHUNK_CODEC_ZSTD_CODEC_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "seqchunk/common/error.h"
#include "seqchunk/common/types.h"

namespace seqchunk::codec {

// =============================================================================
// Constants
// =============================================================================

/// @brief Upper bound on a decompressed payload (1 GiB).
inline constexpr std::size_t kDefaultMaxDecompressedSize = std::size_t{1} << 30;

// =============================================================================
// Codec Configuration
// =============================================================================

/// @brief Configuration for ZstdCodec.
struct CodecConfig {
    /// @brief Zstd compression level (1-22).
    int level = kDefaultZstdLevel;

    /// @brief Largest frame content size decompress() will allocate for.
    std::size_t maxDecompressedSize = kDefaultMaxDecompressedSize;

    /// @brief Validate the configuration.
    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] bool operator==(const CodecConfig& other) const noexcept = default;
};

// =============================================================================
// ZstdCodec Class
// =============================================================================

/// @brief Zstd payload codec.
///
/// Usage:
/// @code
/// ZstdCodec codec;
/// auto payload = codec.compress(bytes);
/// auto restored = codec.decompress(payload);   // == bytes
/// @endcode
class ZstdCodec {
public:
    /// @brief Construct with configuration.
    explicit ZstdCodec(CodecConfig config = {}) noexcept : config_(config) {}

    /// @brief Compress a byte payload into one Zstd frame.
    /// @throws CodecError if Zstd reports a failure.
    [[nodiscard]] std::vector<std::uint8_t> compress(std::span<const std::uint8_t> data) const;

    /// @brief Restore a payload produced by compress().
    /// @throws CodecError if the input is not exactly one valid frame.
    [[nodiscard]] std::vector<std::uint8_t> decompress(std::span<const std::uint8_t> data) const;

    /// @brief Get the configuration.
    [[nodiscard]] const CodecConfig& config() const noexcept { return config_; }

private:
    CodecConfig config_;
};

// =============================================================================
// Checksum Utilities
// =============================================================================

/// @brief xxHash64 (seed 0) of a byte buffer.
[[nodiscard]] Checksum checksum(std::span<const std::uint8_t> data) noexcept;

/// @brief View a character buffer as bytes.
[[nodiscard]] inline std::span<const std::uint8_t> asBytes(std::string_view text) noexcept {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace seqchunk::codec

#endif  // SEQCHUNK_CODEC_ZSTD_CODEC_H
