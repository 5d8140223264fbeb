// =============================================================================
// seqchunk - Shared Command Helpers
// =============================================================================
// Chunking settings shared by every command that touches a store, and
// output helpers.
// =============================================================================

#ifndef SEQCHUNK_COMMANDS_COMMAND_COMMON_H
#define SEQCHUNK_COMMANDS_COMMAND_COMMON_H

#include <string>
#include <string_view>

#include "seqchunk/common/types.h"
#include "seqchunk/config/chunking_config.h"

namespace seqchunk::commands {

/// @brief Chunking settings as given on the command line or in the config file.
struct StoreOptions {
    /// @brief Backing-store profile name.
    std::string profile = "mongodb";

    /// @brief Chunk size override (0 = profile policy).
    ChunkSize chunkSize = 0;

    /// @brief Zstd compression level.
    int level = kDefaultZstdLevel;

    /// @brief Store arbitrary bytes instead of ASCII text.
    bool binary = false;
};

/// @brief Build and validate a ChunkingConfig.
/// @throws UsageError on an unknown profile or invalid setting.
[[nodiscard]] config::ChunkingConfig toChunkingConfig(const StoreOptions& options);

/// @brief Quote and escape a string for JSON output.
[[nodiscard]] std::string jsonQuote(std::string_view text);

}  // namespace seqchunk::commands

#endif  // SEQCHUNK_COMMANDS_COMMAND_COMMON_H
