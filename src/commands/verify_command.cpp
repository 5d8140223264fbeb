// =============================================================================
// seqchunk - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <iostream>
#include <vector>

#include <fmt/format.h>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"
#include "seqchunk/store/directory_chunk_store.h"

namespace seqchunk::commands {

namespace {

std::string joinNumbers(const std::vector<ChunkNumber>& numbers) {
    std::string out;
    for (std::size_t i = 0; i < numbers.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += std::to_string(numbers[i]);
    }
    return out;
}

}  // namespace

void printVerifyReport(std::ostream& out, const store::VerifyReport& report) {
    out << fmt::format("{}\t{}\t{} chunks\t{} bytes\n", report.info.sequenceIdentifier,
                       report.ok() ? "OK" : "FAILED", report.info.chunkCount,
                       report.info.rawBytes);
    if (!report.missingChunks.empty()) {
        out << "  missing chunks:   " << joinNumbers(report.missingChunks) << '\n';
    }
    if (!report.duplicateChunks.empty()) {
        out << "  duplicate chunks: " << joinNumbers(report.duplicateChunks) << '\n';
    }
    if (!report.corruptChunks.empty()) {
        out << "  corrupt chunks:   " << joinNumbers(report.corruptChunks) << '\n';
    }
}

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

int VerifyCommand::execute() {
    try {
        auto const config = toChunkingConfig(options_.store);
        if (!std::filesystem::is_directory(options_.storePath)) {
            throw IOError("Store directory not found",
                          ErrorContext().withFile(options_.storePath.string()));
        }
        store::DirectoryChunkStore chunkStore(options_.storePath);
        store::SequenceStore const sequences(config, chunkStore);

        std::vector<std::string> identifiers;
        if (options_.identifier.empty()) {
            identifiers = sequences.listSequences();
        } else {
            identifiers.push_back(options_.identifier);
        }

        bool corrupt = false;
        bool incomplete = false;
        for (const auto& identifier : identifiers) {
            auto const report = sequences.verify(identifier);
            printVerifyReport(std::cout, report);

            corrupt = corrupt || !report.corruptChunks.empty();
            incomplete = incomplete || !report.missingChunks.empty() ||
                         !report.duplicateChunks.empty();
            if (options_.failFast && !report.ok()) {
                break;
            }
        }

        SEQCHUNK_LOG_INFO("Verified {} sequences in {}", identifiers.size(),
                          options_.storePath.string());
        if (corrupt) {
            return toExitCode(ErrorCode::kChecksumError);
        }
        if (incomplete) {
            return toExitCode(ErrorCode::kIncompleteChunkSet);
        }
        return 0;

    } catch (const SeqChunkException& e) {
        SEQCHUNK_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    }
}

}  // namespace seqchunk::commands
