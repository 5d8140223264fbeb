// =============================================================================
// seqchunk - Resolve Command Implementation
// =============================================================================

#include "resolve_command.h"

#include <iostream>

#include <fmt/format.h>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"

namespace seqchunk::commands {

void printResolutionText(std::ostream& out, const chunk::RangeResolution& resolution) {
    out << fmt::format("Sequence:     {}\n", resolution.sequenceIdentifier);
    out << fmt::format("Chunks:       {}..{} ({} partitions)\n", resolution.firstChunk,
                       resolution.lastChunk, resolution.partitionCount());
    out << fmt::format("Local range:  [{}, {})\n", resolution.localStart, resolution.localEnd);
    if (resolution.strand) {
        out << fmt::format("Strand:       {}\n", *resolution.strand);
    }
    for (const auto& id : resolution.partitions) {
        out << "  " << id << '\n';
    }
}

void printResolutionJson(std::ostream& out, const chunk::RangeResolution& resolution) {
    out << "{\n";
    out << "  \"accession_version\": " << jsonQuote(resolution.sequenceIdentifier) << ",\n";
    out << "  \"partitions\": [";
    for (std::size_t i = 0; i < resolution.partitions.size(); ++i) {
        out << (i == 0 ? "" : ", ") << jsonQuote(resolution.partitions[i]);
    }
    out << "],\n";
    out << "  \"start\": " << resolution.localStart << ",\n";
    out << "  \"end\": " << resolution.localEnd;
    if (resolution.strand) {
        out << ",\n  \"strand\": " << jsonQuote(*resolution.strand);
    }
    out << "\n}\n";
}

ResolveCommand::ResolveCommand(ResolveOptions options) : options_(std::move(options)) {}

int ResolveCommand::execute() {
    try {
        auto const config = toChunkingConfig(options_.store);

        chunk::RangeRequest request;
        request.sequenceIdentifier = options_.identifier;
        request.start = options_.start;
        request.end = options_.end;
        request.strand = options_.strand;

        auto const resolution = chunk::resolve(request, config.chunkSize());
        if (options_.jsonOutput) {
            printResolutionJson(std::cout, resolution);
        } else {
            printResolutionText(std::cout, resolution);
        }
        return 0;

    } catch (const SeqChunkException& e) {
        SEQCHUNK_LOG_ERROR("Resolve failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace seqchunk::commands
