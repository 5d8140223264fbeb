// =============================================================================
// seqchunk - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <iostream>

#include <fmt/format.h>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"
#include "seqchunk/store/directory_chunk_store.h"

namespace seqchunk::commands {

void printInfoText(std::ostream& out, const std::vector<store::SequenceInfo>& sequences) {
    out << fmt::format("{:<24} {:>8} {:>14} {:>14} {:>7}\n", "sequence", "chunks", "raw bytes",
                       "stored bytes", "ratio");

    std::uint64_t rawTotal = 0;
    std::uint64_t storedTotal = 0;
    for (const auto& info : sequences) {
        double const ratio = info.rawBytes == 0 ? 0.0
                                                : static_cast<double>(info.compressedBytes) /
                                                      static_cast<double>(info.rawBytes);
        out << fmt::format("{:<24} {:>8} {:>14} {:>14} {:>7.3f}\n", info.sequenceIdentifier,
                           info.chunkCount, info.rawBytes, info.compressedBytes, ratio);
        rawTotal += info.rawBytes;
        storedTotal += info.compressedBytes;
    }
    out << fmt::format("{} sequences, {} raw bytes, {} stored bytes\n", sequences.size(),
                       rawTotal, storedTotal);
}

void printInfoJson(std::ostream& out, const std::vector<store::SequenceInfo>& sequences) {
    out << "[";
    for (std::size_t i = 0; i < sequences.size(); ++i) {
        const auto& info = sequences[i];
        out << (i == 0 ? "\n" : ",\n");
        out << "  {\"accession_version\": " << jsonQuote(info.sequenceIdentifier)
            << ", \"chunks\": " << info.chunkCount << ", \"raw_bytes\": " << info.rawBytes
            << ", \"stored_bytes\": " << info.compressedBytes << "}";
    }
    out << (sequences.empty() ? "]\n" : "\n]\n");
}

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

int InfoCommand::execute() {
    try {
        auto const config = toChunkingConfig(options_.store);
        if (!std::filesystem::is_directory(options_.storePath)) {
            throw IOError("Store directory not found",
                          ErrorContext().withFile(options_.storePath.string()));
        }
        store::DirectoryChunkStore chunkStore(options_.storePath);
        store::SequenceStore const sequences(config, chunkStore);

        std::vector<store::SequenceInfo> infos;
        for (const auto& identifier : sequences.listSequences()) {
            infos.push_back(sequences.describe(identifier));
        }

        if (options_.jsonOutput) {
            printInfoJson(std::cout, infos);
        } else {
            printInfoText(std::cout, infos);
        }
        return 0;

    } catch (const SeqChunkException& e) {
        SEQCHUNK_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace seqchunk::commands
