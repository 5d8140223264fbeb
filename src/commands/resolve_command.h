// =============================================================================
// seqchunk - Resolve Command
// =============================================================================
// Prints which chunks hold a [start, end) range and where the range lies in
// their merge. Needs no store.
// =============================================================================

#ifndef SEQCHUNK_COMMANDS_RESOLVE_COMMAND_H
#define SEQCHUNK_COMMANDS_RESOLVE_COMMAND_H

#include <optional>
#include <ostream>
#include <string>

#include "seqchunk/chunk/range_resolver.h"
#include "seqchunk/common/types.h"
#include "command_common.h"

namespace seqchunk::commands {

/// @brief Configuration options for the resolve command.
struct ResolveOptions {
    std::string identifier;
    SeqPos start = 0;
    SeqPos end = 0;
    std::optional<std::string> strand;

    /// @brief Chunking settings that determine the chunk size.
    StoreOptions store;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

/// @brief Command handler for range resolution.
class ResolveCommand {
public:
    explicit ResolveCommand(ResolveOptions options);

    /// @brief Execute the resolution.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const ResolveOptions& options() const noexcept { return options_; }

private:
    ResolveOptions options_;
};

/// @brief Print a resolution as aligned text.
void printResolutionText(std::ostream& out, const chunk::RangeResolution& resolution);

/// @brief Print a resolution as a JSON object.
void printResolutionJson(std::ostream& out, const chunk::RangeResolution& resolution);

}  // namespace seqchunk::commands

#endif  // SEQCHUNK_COMMANDS_RESOLVE_COMMAND_H
