// =============================================================================
// seqchunk - Verify Command
// =============================================================================
// Checks stored sequences: every chunk is decompressed and compared with its
// recorded size and checksum, and chunk numbers are checked for gaps and
// duplicates.
//
// Exit code: 0 when every checked sequence is intact, kChecksumError when a
// chunk is corrupt, kIncompleteChunkSet when chunks are only missing or
// duplicated.
// =============================================================================

#ifndef SEQCHUNK_COMMANDS_VERIFY_COMMAND_H
#define SEQCHUNK_COMMANDS_VERIFY_COMMAND_H

#include <filesystem>
#include <ostream>
#include <string>

#include "command_common.h"
#include "seqchunk/store/sequence_store.h"

namespace seqchunk::commands {

/// @brief Configuration options for the verify command.
struct VerifyOptions {
    /// @brief Store directory.
    std::filesystem::path storePath;

    /// @brief Sequence to check; every stored sequence when empty.
    std::string identifier;

    /// @brief Stop at the first damaged sequence.
    bool failFast = false;

    /// @brief Chunking settings the store was written with.
    StoreOptions store;
};

/// @brief Command handler for verifying stored sequences.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    /// @brief Execute verification.
    /// @return Exit code (0 = all intact).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    VerifyOptions options_;
};

/// @brief Print one report line and its problems.
void printVerifyReport(std::ostream& out, const store::VerifyReport& report);

}  // namespace seqchunk::commands

#endif  // SEQCHUNK_COMMANDS_VERIFY_COMMAND_H
