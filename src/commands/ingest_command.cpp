// =============================================================================
// seqchunk - Ingest Command Implementation
// =============================================================================

#include "ingest_command.h"

#include <iostream>

#include <fmt/format.h>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"
#include "seqchunk/io/fasta_reader.h"
#include "seqchunk/store/directory_chunk_store.h"
#include "seqchunk/store/sequence_store.h"

namespace seqchunk::commands {

IngestCommand::IngestCommand(IngestOptions options) : options_(std::move(options)) {}

int IngestCommand::execute() {
    try {
        auto const config = toChunkingConfig(options_.store);
        store::DirectoryChunkStore chunkStore(options_.storePath);
        store::SequenceStore sequences(config, chunkStore);
        io::FastaReader reader(options_.inputPath);

        SEQCHUNK_LOG_INFO("Ingesting {} into {} (profile {}, chunk size {})",
                          options_.inputPath.string(), options_.storePath.string(),
                          storeProfileToString(config.profile), config.chunkSize());

        std::size_t records = 0;
        std::uint64_t rawTotal = 0;
        std::uint64_t compressedTotal = 0;
        while (auto record = reader.readRecord()) {
            auto const summary = sequences.ingest(record->id, record->sequence);
            ++records;
            rawTotal += summary.rawBytes;
            compressedTotal += summary.compressedBytes;

            if (!options_.quiet) {
                std::cout << fmt::format("{}\t{} bp\t{} chunks\t{} bytes\n",
                                         summary.sequenceIdentifier, summary.rawBytes,
                                         summary.chunkCount, summary.compressedBytes);
            }
        }

        if (records == 0) {
            SEQCHUNK_LOG_WARNING("No FASTA records found in {}", options_.inputPath.string());
        }
        SEQCHUNK_LOG_INFO("Ingested {} sequences: {} bytes -> {} bytes", records, rawTotal,
                          compressedTotal);
        return 0;

    } catch (const SeqChunkException& e) {
        SEQCHUNK_LOG_ERROR("Ingest failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace seqchunk::commands
