// =============================================================================
// seqchunk - Chunk Record Format Implementation
// =============================================================================

#include "seqchunk/format/chunk_record.h"

#include <algorithm>
#include <string>

#include <fmt/format.h>

namespace seqchunk::format {

using chunk::Chunk;

std::vector<std::uint8_t> encodeChunkRecord(const Chunk& chunk) {
    std::vector<std::uint8_t> result;
    result.reserve(kMinRecordSize + chunk.sequenceIdentifier.size() + chunk.payload.size());

    auto writeU32 = [&result](std::uint32_t value) {
        for (int i = 0; i < 4; ++i) {
            result.push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
        }
    };

    auto writeU64 = [&result](std::uint64_t value) {
        for (int i = 0; i < 8; ++i) {
            result.push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
        }
    };

    result.insert(result.end(), kRecordMagic.begin(), kRecordMagic.end());
    result.push_back(kCurrentVersion);
    result.push_back(static_cast<std::uint8_t>(CodecFamily::kZstd));
    result.push_back(0);
    result.push_back(0);
    writeU64(chunk.chunkNumber);
    writeU64(chunk.rawSize);
    writeU64(chunk.checksum);
    writeU32(static_cast<std::uint32_t>(chunk.sequenceIdentifier.size()));
    result.insert(result.end(), chunk.sequenceIdentifier.begin(), chunk.sequenceIdentifier.end());
    writeU64(chunk.payload.size());
    result.insert(result.end(), chunk.payload.begin(), chunk.payload.end());

    return result;
}

Result<Chunk> decodeChunkRecord(std::span<const std::uint8_t> data) {
    if (data.size() < kMinRecordSize) {
        return makeError<Chunk>(ErrorCode::kFormatError,
                                fmt::format("Chunk record too small: {} bytes", data.size()));
    }

    auto readU32 = [](const std::uint8_t* ptr) -> std::uint32_t {
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value |= static_cast<std::uint32_t>(ptr[i]) << (i * 8);
        }
        return value;
    };

    auto readU64 = [](const std::uint8_t* ptr) -> std::uint64_t {
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value |= static_cast<std::uint64_t>(ptr[i]) << (i * 8);
        }
        return value;
    };

    if (!std::equal(kRecordMagic.begin(), kRecordMagic.end(), data.begin())) {
        return makeError<Chunk>(ErrorCode::kFormatError, "Invalid chunk record magic");
    }

    std::uint8_t const version = data[4];
    if (decodeMajorVersion(version) != kFormatVersionMajor) {
        return makeError<Chunk>(
            ErrorCode::kFormatError,
            fmt::format("Unsupported chunk record version {}", decodeMajorVersion(version)));
    }

    std::uint8_t const codecFamily = data[5];
    if (codecFamily != static_cast<std::uint8_t>(CodecFamily::kZstd)) {
        return makeError<Chunk>(ErrorCode::kUnsupportedCodec,
                                fmt::format("unsupported codec family: 0x{:02x}", codecFamily));
    }

    Chunk chunk;
    chunk.chunkNumber = readU64(data.data() + 8);
    chunk.rawSize = readU64(data.data() + 16);
    chunk.checksum = readU64(data.data() + 24);

    std::size_t const idLength = readU32(data.data() + 32);
    if (data.size() - kMinRecordSize < idLength) {
        return makeError<Chunk>(ErrorCode::kFormatError, "Chunk record truncated in identifier");
    }
    const std::uint8_t* ptr = data.data() + kFixedHeaderSize;
    chunk.sequenceIdentifier.assign(reinterpret_cast<const char*>(ptr), idLength);
    ptr += idLength;

    std::uint64_t const payloadLength = readU64(ptr);
    ptr += 8;
    std::size_t const remaining = data.size() - kMinRecordSize - idLength;
    if (payloadLength != remaining) {
        return makeError<Chunk>(
            ErrorCode::kFormatError,
            fmt::format("Chunk record payload length {} does not match remaining {} bytes",
                        payloadLength, remaining));
    }
    chunk.payload.assign(ptr, ptr + remaining);

    if (chunk.sequenceIdentifier.empty()) {
        return makeError<Chunk>(ErrorCode::kFormatError, "Chunk record has empty identifier");
    }
    chunk.id = chunk::makeChunkId(chunk.sequenceIdentifier, chunk.chunkNumber);

    return chunk;
}

}  // namespace seqchunk::format
