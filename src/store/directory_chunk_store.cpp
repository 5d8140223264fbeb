// =============================================================================
// seqchunk - Directory Chunk Store Implementation
// =============================================================================

#include "seqchunk/store/directory_chunk_store.h"

#include <fstream>
#include <iterator>
#include <set>

#include <fmt/format.h>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"
#include "seqchunk/format/chunk_record.h"

namespace seqchunk::store {

using chunk::Chunk;

namespace fs = std::filesystem;

namespace {

/// @brief Parts of a record file's chunk id, skipping foreign files.
std::optional<chunk::ChunkIdParts> idPartsOf(const std::optional<std::string>& chunkId) {
    if (!chunkId) {
        return std::nullopt;
    }
    try {
        return chunk::parseChunkId(*chunkId);
    } catch (const FormatError& e) {
        SEQCHUNK_LOG_WARNING("Ignoring unrecognized record file '{}': {}", *chunkId,
                             e.message());
        return std::nullopt;
    }
}

}  // namespace

DirectoryChunkStore::DirectoryChunkStore(fs::path root) : root_(std::move(root)) {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) {
        throw IOError("Failed to create store directory", ec,
                      ErrorContext().withFile(root_.string()));
    }
    if (!fs::is_directory(root_)) {
        throw IOError("Store path is not a directory", ErrorContext().withFile(root_.string()));
    }
}

fs::path DirectoryChunkStore::pathFor(std::string_view chunkId) const {
    if (chunkId.empty() || chunkId.find_first_of("/\\") != std::string_view::npos ||
        chunkId.find('\0') != std::string_view::npos) {
        throw InvalidArgumentError(
            fmt::format("Chunk id '{}' cannot be used as a file name", chunkId));
    }
    return root_ / (std::string(chunkId) + std::string(kChunkFileExtension));
}

std::optional<std::string> DirectoryChunkStore::chunkIdOf(const fs::path& path) {
    if (path.extension() != kChunkFileExtension) {
        return std::nullopt;
    }
    return path.stem().string();
}

std::vector<std::pair<fs::path, ChunkNumber>> DirectoryChunkStore::recordFilesOf(
    std::string_view identifier) const {
    std::vector<std::pair<fs::path, ChunkNumber>> files;
    for (const auto& entry : fs::directory_iterator(root_)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        auto const parts = idPartsOf(chunkIdOf(entry.path()));
        if (parts && parts->sequenceIdentifier == identifier) {
            files.emplace_back(entry.path(), parts->chunkNumber);
        }
    }
    return files;
}

Chunk DirectoryChunkStore::readRecord(const fs::path& path, std::string_view expectedId) const {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IOError("Failed to open chunk record", ErrorContext().withFile(path.string()));
    }

    std::vector<std::uint8_t> data((std::istreambuf_iterator<char>(file)),
                                   std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw IOError("Failed to read chunk record", ErrorContext().withFile(path.string()));
    }

    auto decoded = format::decodeChunkRecord(data);
    if (!decoded) {
        if (decoded.error().code() != ErrorCode::kFormatError) {
            decoded.error().throwException();
        }
        throw FormatError(decoded.error().message(), ErrorContext().withFile(path.string()));
    }
    if (decoded->id != expectedId) {
        throw FormatError(
            fmt::format("Record holds chunk '{}', expected '{}'", decoded->id, expectedId),
            ErrorContext().withFile(path.string()));
    }
    return std::move(*decoded);
}

std::vector<Chunk> DirectoryChunkStore::fetch(std::span<const std::string> ids) const {
    std::vector<Chunk> result;
    result.reserve(ids.size());
    for (const auto& id : ids) {
        fs::path const path = pathFor(id);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            if (ec) {
                throw IOError("Failed to stat chunk record", ec,
                              ErrorContext().withFile(path.string()));
            }
            continue;
        }
        result.push_back(readRecord(path, id));
    }
    return result;
}

std::vector<Chunk> DirectoryChunkStore::fetchSequence(std::string_view identifier) const {
    std::vector<Chunk> result;
    for (const auto& [path, number] : recordFilesOf(identifier)) {
        result.push_back(readRecord(path, chunk::makeChunkId(identifier, number)));
    }
    return result;
}

SequenceScan DirectoryChunkStore::scanSequence(std::string_view identifier) const {
    SequenceScan scan;
    for (const auto& [path, number] : recordFilesOf(identifier)) {
        try {
            scan.chunks.push_back(readRecord(path, chunk::makeChunkId(identifier, number)));
        } catch (const FormatError& e) {
            SEQCHUNK_LOG_WARNING("{}", e.what());
            scan.damaged.push_back({number, e.message()});
        } catch (const UnsupportedCodecError& e) {
            SEQCHUNK_LOG_WARNING("{}: {}", path.string(), e.message());
            scan.damaged.push_back({number, e.message()});
        }
    }
    return scan;
}

std::vector<std::string> DirectoryChunkStore::listSequences() const {
    std::set<std::string> identifiers;
    for (const auto& entry : fs::directory_iterator(root_)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        if (auto parts = idPartsOf(chunkIdOf(entry.path()))) {
            identifiers.insert(std::move(parts->sequenceIdentifier));
        }
    }
    return {identifiers.begin(), identifiers.end()};
}
void DirectoryChunkStore::store(std::span<const Chunk> chunks) {
    for (const auto& chunk : chunks) {
        fs::path const path = pathFor(chunk.id);
        fs::path const tempPath = path.string() + ".tmp";
        auto const record = format::encodeChunkRecord(chunk);

        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) {
                throw IOError("Failed to create chunk record",
                              ErrorContext(chunk.sequenceIdentifier)
                                  .withChunk(chunk.chunkNumber)
                                  .withFile(tempPath.string()));
            }
            file.write(reinterpret_cast<const char*>(record.data()),
                       static_cast<std::streamsize>(record.size()));
            file.flush();
            if (!file) {
                throw IOError("Failed to write chunk record",
                              ErrorContext(chunk.sequenceIdentifier)
                                  .withChunk(chunk.chunkNumber)
                                  .withFile(tempPath.string()));
            }
        }

        std::error_code ec;
        fs::rename(tempPath, path, ec);
        if (ec) {
            fs::remove(tempPath, ec);
            throw IOError("Failed to move chunk record into place",
                          ErrorContext(chunk.sequenceIdentifier)
                              .withChunk(chunk.chunkNumber)
                              .withFile(path.string()));
        }
    }
    SEQCHUNK_LOG_DEBUG("Stored {} chunk records in {}", chunks.size(), root_.string());
}

std::size_t DirectoryChunkStore::removeChunksFrom(std::string_view identifier,
                                                  ChunkNumber firstChunk) {
    std::vector<fs::path> doomed;
    for (const auto& [path, number] : recordFilesOf(identifier)) {
        if (number >= firstChunk) {
            doomed.push_back(path);
        }
    }

    for (const auto& path : doomed) {
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            throw IOError("Failed to remove chunk record", ec,
                          ErrorContext(std::string(identifier)).withFile(path.string()));
        }
    }
    return doomed.size();
}

}  // namespace seqchunk::store
