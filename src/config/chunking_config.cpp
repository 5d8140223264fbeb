// =============================================================================
// seqchunk - Chunking Configuration Implementation
// =============================================================================

#include "seqchunk/config/chunking_config.h"

#include <algorithm>
#include <cctype>
#include <string>

#include <fmt/format.h>

namespace seqchunk::config {

namespace {

std::string toLower(std::string_view str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

VoidResult ChunkingConfig::validate() const {
    if (chunkSizeOverride.has_value() && *chunkSizeOverride == 0) {
        return makeVoidError(ErrorCode::kUsageError, "Chunk size must be positive");
    }
    return codec.validate();
}

Result<ChunkingConfig> ChunkingConfig::fromProfileName(std::string_view profileName,
                                                       ChunkSize chunkSize) {
    auto profile = parseStoreProfile(profileName);
    if (!profile) {
        return std::unexpected(profile.error());
    }

    ChunkingConfig config;
    config.profile = *profile;
    if (chunkSize != 0) {
        config.chunkSizeOverride = chunkSize;
    }
    return config;
}

Result<StoreProfile> parseStoreProfile(std::string_view name) {
    const std::string lower = toLower(name);

    if (lower == "mongodb" || lower == "mongo") {
        return StoreProfile::kMongoDb;
    }
    if (lower == "azure" || lower == "azuretable") {
        return StoreProfile::kAzureTable;
    }
    if (lower == "mariadb" || lower == "mysql") {
        return StoreProfile::kMariaDb;
    }
    if (lower == "sqlite") {
        return StoreProfile::kSqlite;
    }
    return makeError<StoreProfile>(ErrorCode::kUsageError,
                                   fmt::format("Unknown store profile '{}'", name));
}

Result<TextEncoding> parseTextEncoding(std::string_view name) {
    const std::string lower = toLower(name);

    if (lower == "ascii") {
        return TextEncoding::kAscii;
    }
    if (lower == "binary") {
        return TextEncoding::kBinary;
    }
    return makeError<TextEncoding>(ErrorCode::kUsageError,
                                   fmt::format("Unknown text encoding '{}'", name));
}

}  // namespace seqchunk::config
