// =============================================================================
// seqchunk - Chunk Record Format
// =============================================================================
// Binary layout of one stored chunk (all integers little-endian):
//
//   Offset  Size  Field
//   0       4     magic "SQCK"
//   4       1     version (major:4bit, minor:4bit)
//   5       1     codec family
//   6       2     reserved (0)
//   8       8     chunk number
//   16      8     raw size (uncompressed slice length)
//   24      8     checksum (xxHash64 of the uncompressed slice)
//   32      4     identifier length N
//   36      N     identifier bytes
//   36+N    8     payload length M
//   44+N    M     payload bytes (Zstd frame)
//
// The chunk id is not stored; it is derived from identifier and number.
// =============================================================================

#ifndef SEQCHUNK_FORMAT_CHUNK_RECORD_H
#define SEQCHUNK_FORMAT_CHUNK_RECORD_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "seqchunk/chunk/chunk.h"
#include "seqchunk/common/error.h"

namespace seqchunk::format {

// =============================================================================
// Constants
// =============================================================================

/// @brief Record magic bytes.
inline constexpr std::array<std::uint8_t, 4> kRecordMagic = {'S', 'Q', 'C', 'K'};

/// @brief Current format major version.
/// @note Major version changes indicate incompatible format changes.
inline constexpr std::uint8_t kFormatVersionMajor = 1;

/// @brief Current format minor version.
inline constexpr std::uint8_t kFormatVersionMinor = 0;

/// @brief Encode version as single byte (major:4bit, minor:4bit).
[[nodiscard]] constexpr std::uint8_t encodeVersion(std::uint8_t major, std::uint8_t minor) noexcept {
    return static_cast<std::uint8_t>((major << 4) | (minor & 0x0F));
}

/// @brief Decode major version from version byte.
[[nodiscard]] constexpr std::uint8_t decodeMajorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version >> 4);
}

/// @brief Current format version (encoded).
inline constexpr std::uint8_t kCurrentVersion =
    encodeVersion(kFormatVersionMajor, kFormatVersionMinor);

/// @brief Size of the fixed part before the identifier.
inline constexpr std::size_t kFixedHeaderSize = 36;

/// @brief Smallest possible record (empty identifier and payload).
inline constexpr std::size_t kMinRecordSize = kFixedHeaderSize + 8;

/// @brief Payload codec families.
enum class CodecFamily : std::uint8_t {
    kZstd = 0x1
};

// =============================================================================
// Encoding / Decoding
// =============================================================================

/// @brief Serialize a chunk into a record.
[[nodiscard]] std::vector<std::uint8_t> encodeChunkRecord(const chunk::Chunk& chunk);

/// @brief Deserialize a record.
/// @return The chunk, or kFormatError on bad magic, unsupported major version,
///         truncation or trailing bytes, or kUnsupportedCodec on an unknown
///         codec family.
[[nodiscard]] Result<chunk::Chunk> decodeChunkRecord(std::span<const std::uint8_t> data);

}  // namespace seqchunk::format

#endif  // SEQCHUNK_FORMAT_CHUNK_RECORD_H
