// =============================================================================
// seqchunk - Extract Command
// =============================================================================
// Writes a stored sequence, or a [start, end) range of it, as FASTA.
//
// Range output header: ">{id}:{start}-{end}" followed by " strand={s}" when
// a strand was given.
// =============================================================================

#ifndef SEQCHUNK_COMMANDS_EXTRACT_COMMAND_H
#define SEQCHUNK_COMMANDS_EXTRACT_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "seqchunk/common/types.h"
#include "command_common.h"

namespace seqchunk::commands {

/// @brief Configuration options for the extract command.
struct ExtractOptions {
    /// @brief Store directory.
    std::filesystem::path storePath;

    /// @brief Sequence identifier.
    std::string identifier;

    /// @brief Range start (inclusive); whole sequence when unset.
    std::optional<SeqPos> start;

    /// @brief Range end (exclusive); whole sequence when unset.
    std::optional<SeqPos> end;

    /// @brief Orientation tag carried into the header.
    std::optional<std::string> strand;

    /// @brief Output file ("-" or empty for stdout).
    std::filesystem::path outputPath;

    /// @brief FASTA line width (0 = single line).
    std::size_t lineWidth = 60;

    /// @brief Chunking settings the store was written with.
    StoreOptions store;
};

/// @brief Command handler for extracting sequences.
class ExtractCommand {
public:
    explicit ExtractCommand(ExtractOptions options);

    /// @brief Execute the extraction.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ExtractOptions& options() const noexcept { return options_; }

private:
    void writeOutput(std::string_view header, std::string_view sequence) const;

    ExtractOptions options_;
};

/// @brief Write one FASTA record, wrapping the sequence at @p lineWidth.
void writeFasta(std::ostream& out, std::string_view header, std::string_view sequence,
                std::size_t lineWidth);

}  // namespace seqchunk::commands

#endif  // SEQCHUNK_COMMANDS_EXTRACT_COMMAND_H
