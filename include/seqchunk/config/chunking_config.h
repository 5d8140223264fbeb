// =============================================================================
// seqchunk - Chunking Configuration
// =============================================================================
// Selects the chunk size policy for a backing store and the codec/encoding
// settings used when splitting and merging.
//
// Profiles are parsed and validated once, when the configuration is built;
// the core operations only ever receive the resulting integer size.
// =============================================================================

#ifndef SEQCHUNK_CONFIG_CHUNKING_CONFIG_H
#define SEQCHUNK_CONFIG_CHUNKING_CONFIG_H

#include <optional>
#include <string_view>

#include "seqchunk/chunk/chunk_merger.h"
#include "seqchunk/chunk/chunk_splitter.h"
#include "seqchunk/codec/zstd_codec.h"
#include "seqchunk/common/error.h"
#include "seqchunk/common/types.h"

namespace seqchunk::config {

/// @brief Chunking settings for one backing store.
struct ChunkingConfig {
    /// @brief Backing-store profile (determines the default chunk size).
    StoreProfile profile = StoreProfile::kMongoDb;

    /// @brief Explicit chunk size replacing the profile's policy.
    std::optional<ChunkSize> chunkSizeOverride;

    /// @brief Text encoding of stored sequences.
    TextEncoding encoding = TextEncoding::kAscii;

    /// @brief Payload codec settings.
    codec::CodecConfig codec;

    /// @brief Chunk size in effect.
    [[nodiscard]] ChunkSize chunkSize() const noexcept {
        return chunkSizeOverride.value_or(chunkSizeFor(profile));
    }

    /// @brief Splitter configuration derived from these settings.
    [[nodiscard]] chunk::SplitterConfig splitterConfig() const noexcept {
        return chunk::SplitterConfig{encoding, codec};
    }

    /// @brief Merger configuration derived from these settings.
    [[nodiscard]] chunk::MergerConfig mergerConfig(GapPolicy gapPolicy) const noexcept {
        chunk::MergerConfig merger;
        merger.encoding = encoding;
        merger.gapPolicy = gapPolicy;
        merger.codec = codec;
        return merger;
    }

    /// @brief Validate the configuration.
    /// @return VoidResult with kUsageError on a zero chunk size or bad codec level.
    [[nodiscard]] VoidResult validate() const;

    /// @brief Build a configuration for a profile name.
    /// @param profileName Profile name (see parseStoreProfile()).
    /// @param chunkSize Chunk size override, 0 keeps the profile policy.
    [[nodiscard]] static Result<ChunkingConfig> fromProfileName(std::string_view profileName,
                                                                ChunkSize chunkSize = 0);
};

/// @brief Parse a backing-store profile name.
/// @note Accepts mongodb, azure, mariadb (alias mysql), sqlite; case-insensitive.
[[nodiscard]] Result<StoreProfile> parseStoreProfile(std::string_view name);

/// @brief Parse a text encoding name (ascii, binary).
[[nodiscard]] Result<TextEncoding> parseTextEncoding(std::string_view name);

}  // namespace seqchunk::config

#endif  // SEQCHUNK_CONFIG_CHUNKING_CONFIG_H
