// =============================================================================
// seqchunk - Zstd Chunk Codec Implementation
// =============================================================================

#include "seqchunk/codec/zstd_codec.h"

#include <memory>
#include <string>

#include <fmt/format.h>
#include <xxhash.h>
#include <zstd.h>

namespace seqchunk::codec {

namespace {

struct CCtxDeleter {
    void operator()(ZSTD_CCtx* ctx) const noexcept { ZSTD_freeCCtx(ctx); }
};

using CCtxPtr = std::unique_ptr<ZSTD_CCtx, CCtxDeleter>;

void checkZstd(std::size_t code, const char* what) {
    if (ZSTD_isError(code)) {
        throw CodecError(fmt::format("Zstd {} failed: {}", what, ZSTD_getErrorName(code)));
    }
}

}  // namespace

// =============================================================================
// CodecConfig Implementation
// =============================================================================

VoidResult CodecConfig::validate() const {
    if (level < kMinZstdLevel || level > kMaxZstdLevel) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("Zstd level must be in range [{}, {}], got {}",
                                         kMinZstdLevel, kMaxZstdLevel, level));
    }
    if (maxDecompressedSize == 0) {
        return makeVoidError(ErrorCode::kUsageError, "maxDecompressedSize must be positive");
    }
    return makeVoidSuccess();
}

// =============================================================================
// ZstdCodec Implementation
// =============================================================================

std::vector<std::uint8_t> ZstdCodec::compress(std::span<const std::uint8_t> data) const {
    CCtxPtr ctx(ZSTD_createCCtx());
    if (!ctx) {
        throw CodecError("Failed to create Zstd compression context");
    }

    checkZstd(ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_compressionLevel, config_.level),
              "level setup");
    checkZstd(ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_checksumFlag, 1), "checksum setup");
    checkZstd(ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_contentSizeFlag, 1), "content size setup");

    std::vector<std::uint8_t> compressed(ZSTD_compressBound(data.size()));
    std::size_t const cSize = ZSTD_compress2(ctx.get(), compressed.data(), compressed.size(),
                                             data.data(), data.size());
    checkZstd(cSize, "compression");

    compressed.resize(cSize);
    return compressed;
}

std::vector<std::uint8_t> ZstdCodec::decompress(std::span<const std::uint8_t> data) const {
    if (data.empty()) {
        throw CodecError("Empty payload is not a Zstd frame");
    }

    unsigned long long const rSize = ZSTD_getFrameContentSize(data.data(), data.size());
    if (rSize == ZSTD_CONTENTSIZE_ERROR) {
        throw CodecError("Invalid Zstd frame");
    }
    if (rSize == ZSTD_CONTENTSIZE_UNKNOWN) {
        throw CodecError("Zstd frame does not record its content size");
    }
    if (rSize > config_.maxDecompressedSize) {
        throw CodecError(fmt::format("Zstd frame content size {} exceeds limit {}", rSize,
                                     config_.maxDecompressedSize));
    }

    // A payload must be exactly one frame; anything after it is corruption
    std::size_t const frameSize = ZSTD_findFrameCompressedSize(data.data(), data.size());
    checkZstd(frameSize, "frame scan");
    if (frameSize != data.size()) {
        throw CodecError(fmt::format("Trailing {} bytes after Zstd frame",
                                     data.size() - frameSize));
    }

    // Keep the destination non-null even for empty content
    std::vector<std::uint8_t> decompressed(static_cast<std::size_t>(rSize) + 1);
    std::size_t const dSize =
        ZSTD_decompress(decompressed.data(), decompressed.size(), data.data(), data.size());
    checkZstd(dSize, "decompression");

    if (dSize != rSize) {
        throw CodecError(fmt::format("Zstd decompressed size mismatch: expected {}, got {}",
                                     rSize, dSize));
    }
    decompressed.resize(dSize);
    return decompressed;
}

// =============================================================================
// Checksum Utilities
// =============================================================================

Checksum checksum(std::span<const std::uint8_t> data) noexcept {
    return XXH64(data.data(), data.size(), 0);
}

}  // namespace seqchunk::codec
