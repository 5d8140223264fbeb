// =============================================================================
// seqchunk - Shared Command Helpers Implementation
// =============================================================================

#include "command_common.h"

#include <fmt/format.h>

#include "seqchunk/common/error.h"

namespace seqchunk::commands {

config::ChunkingConfig toChunkingConfig(const StoreOptions& options) {
    auto config =
        unwrapOrThrow(config::ChunkingConfig::fromProfileName(options.profile, options.chunkSize));
    config.codec.level = options.level;
    config.encoding = options.binary ? TextEncoding::kBinary : TextEncoding::kAscii;
    unwrapOrThrow(config.validate());
    return config;
}

std::string jsonQuote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('"');
    for (char const c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\r':
                out += "\\r";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out.push_back(c);
                }
        }
    }
    out.push_back('"');
    return out;
}

}  // namespace seqchunk::commands
