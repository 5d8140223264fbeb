// =============================================================================
// seqchunk - Info Command
// =============================================================================
// Lists the sequences held in a store directory with their chunk count and
// raw and compressed sizes. Reads record headers only; nothing is
// decompressed.
// =============================================================================

#ifndef SEQCHUNK_COMMANDS_INFO_COMMAND_H
#define SEQCHUNK_COMMANDS_INFO_COMMAND_H

#include <filesystem>
#include <ostream>
#include <vector>

#include "command_common.h"
#include "seqchunk/store/sequence_store.h"

namespace seqchunk::commands {

/// @brief Configuration options for the info command.
struct InfoOptions {
    /// @brief Store directory.
    std::filesystem::path storePath;

    /// @brief Output as JSON.
    bool jsonOutput = false;

    /// @brief Chunking settings the store was written with.
    StoreOptions store;
};

/// @brief Command handler for displaying store contents.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    InfoOptions options_;
};

/// @brief Print sequence summaries as a table.
void printInfoText(std::ostream& out, const std::vector<store::SequenceInfo>& sequences);

/// @brief Print sequence summaries as a JSON array.
void printInfoJson(std::ostream& out, const std::vector<store::SequenceInfo>& sequences);

}  // namespace seqchunk::commands

#endif  // SEQCHUNK_COMMANDS_INFO_COMMAND_H
