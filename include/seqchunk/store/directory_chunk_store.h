// =============================================================================
// seqchunk - Directory Chunk Store
// =============================================================================
// Chunk store keeping one record file per chunk:
//
//   <root>/<chunk id>.sqc
//
// Each record is written to "<file>.tmp" and renamed into place, so a
// reader never observes a partially written chunk. Sequence identifiers
// containing path separators cannot be stored.
// =============================================================================

#ifndef SEQCHUNK_STORE_DIRECTORY_CHUNK_STORE_H
#define SEQCHUNK_STORE_DIRECTORY_CHUNK_STORE_H

#include <filesystem>
#include <optional>
#include <utility>
#include <vector>

#include "seqchunk/store/chunk_store.h"

namespace seqchunk::store {

/// @brief File extension of chunk record files.
inline constexpr std::string_view kChunkFileExtension = ".sqc";

/// @brief Chunk store backed by a directory of record files.
class DirectoryChunkStore final : public ChunkStore {
public:
    /// @brief Open (and create if needed) a store directory.
    /// @throws IOError if the directory cannot be created.
    explicit DirectoryChunkStore(std::filesystem::path root);

    [[nodiscard]] std::vector<chunk::Chunk> fetch(
        std::span<const std::string> ids) const override;
    [[nodiscard]] std::vector<chunk::Chunk> fetchSequence(
        std::string_view identifier) const override;

    /// @brief Decode every record of a sequence; records that fail with
    ///        FormatError or UnsupportedCodecError are reported as damaged.
    [[nodiscard]] SequenceScan scanSequence(std::string_view identifier) const override;

    [[nodiscard]] std::vector<std::string> listSequences() const override;

    void store(std::span<const chunk::Chunk> chunks) override;
    std::size_t removeChunksFrom(std::string_view identifier, ChunkNumber firstChunk) override;

    /// @brief Path of the record file for a chunk id.
    /// @throws InvalidArgumentError if the id cannot name a file.
    [[nodiscard]] std::filesystem::path pathFor(std::string_view chunkId) const;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    /// @brief Read and decode one record file.
    /// @throws FormatError if the record is malformed or holds a chunk other
    ///         than @p expectedId.
    [[nodiscard]] chunk::Chunk readRecord(const std::filesystem::path& path,
                                          std::string_view expectedId) const;

    /// @brief Chunk id encoded in a directory entry name, if it is a record file.
    [[nodiscard]] static std::optional<std::string> chunkIdOf(const std::filesystem::path& path);

    /// @brief Record files of a sequence with the chunk number their name encodes.
    [[nodiscard]] std::vector<std::pair<std::filesystem::path, ChunkNumber>> recordFilesOf(
        std::string_view identifier) const;

    std::filesystem::path root_;
};

}  // namespace seqchunk::store

#endif  // SEQCHUNK_STORE_DIRECTORY_CHUNK_STORE_H
