// =============================================================================
// seqchunk - Extract Command Implementation
// =============================================================================

#include "extract_command.h"

#include <algorithm>
#include <fstream>
#include <iostream>

#include <fmt/format.h>

#include "seqchunk/chunk/range_resolver.h"
#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"
#include "seqchunk/store/directory_chunk_store.h"
#include "seqchunk/store/sequence_store.h"

namespace seqchunk::commands {

void writeFasta(std::ostream& out, std::string_view header, std::string_view sequence,
                std::size_t lineWidth) {
    out << '>' << header << '\n';
    if (lineWidth == 0) {
        out << sequence << '\n';
        return;
    }
    for (std::size_t pos = 0; pos < sequence.size(); pos += lineWidth) {
        out << sequence.substr(pos, lineWidth) << '\n';
    }
}

ExtractCommand::ExtractCommand(ExtractOptions options) : options_(std::move(options)) {}

int ExtractCommand::execute() {
    try {
        if (options_.start.has_value() != options_.end.has_value()) {
            throw UsageError("--start and --end must be given together");
        }

        auto const config = toChunkingConfig(options_.store);
        if (!std::filesystem::is_directory(options_.storePath)) {
            throw IOError("Store directory not found",
                          ErrorContext().withFile(options_.storePath.string()));
        }
        store::DirectoryChunkStore chunkStore(options_.storePath);
        store::SequenceStore const sequences(config, chunkStore);

        if (!options_.start) {
            auto const merged = sequences.fetch(options_.identifier);
            writeOutput(merged.sequenceIdentifier, merged.sequence);
            return 0;
        }

        chunk::RangeRequest request;
        request.sequenceIdentifier = options_.identifier;
        request.start = *options_.start;
        request.end = *options_.end;
        request.strand = options_.strand;

        auto const result = sequences.fetchRange(request);
        std::string header =
            fmt::format("{}:{}-{}", request.sequenceIdentifier, request.start, request.end);
        if (result.resolution.strand) {
            header += fmt::format(" strand={}", *result.resolution.strand);
        }
        writeOutput(header, result.sequence);
        return 0;

    } catch (const SeqChunkException& e) {
        SEQCHUNK_LOG_ERROR("Extract failed: {}", e.what());
        return e.exitCode();
    }
}

void ExtractCommand::writeOutput(std::string_view header, std::string_view sequence) const {
    if (options_.outputPath.empty() || options_.outputPath == "-") {
        writeFasta(std::cout, header, sequence, options_.lineWidth);
        std::cout.flush();
        if (!std::cout) {
            throw IOError("Failed to write to stdout");
        }
        return;
    }

    std::ofstream out(options_.outputPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw IOError("Failed to create output file",
                      ErrorContext().withFile(options_.outputPath.string()));
    }
    writeFasta(out, header, sequence, options_.lineWidth);
    out.flush();
    if (!out) {
        throw IOError("Failed to write output file",
                      ErrorContext().withFile(options_.outputPath.string()));
    }
    SEQCHUNK_LOG_INFO("Wrote {} bytes of {} to {}", sequence.size(), options_.identifier,
                      options_.outputPath.string());
}

}  // namespace seqchunk::commands
