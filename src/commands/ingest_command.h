// =============================================================================
// seqchunk - Ingest Command
// =============================================================================
// Reads FASTA records and stores each sequence as compressed chunks in a
// directory store. A sequence already in the store is replaced.
// =============================================================================

#ifndef SEQCHUNK_COMMANDS_INGEST_COMMAND_H
#define SEQCHUNK_COMMANDS_INGEST_COMMAND_H

#include <filesystem>

#include "command_common.h"

namespace seqchunk::commands {

/// @brief Configuration options for the ingest command.
struct IngestOptions {
    /// @brief Input FASTA file ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Store directory.
    std::filesystem::path storePath;

    /// @brief Chunking settings.
    StoreOptions store;

    /// @brief Suppress the per-sequence summary on stdout.
    bool quiet = false;
};

/// @brief Command handler for ingesting FASTA files.
class IngestCommand {
public:
    explicit IngestCommand(IngestOptions options);

    /// @brief Execute the ingest.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const IngestOptions& options() const noexcept { return options_; }

private:
    IngestOptions options_;
};

}  // namespace seqchunk::commands

#endif  // SEQCHUNK_COMMANDS_INGEST_COMMAND_H
