// =============================================================================
// seqchunk - Command Tests
// =============================================================================
// End-to-end runs of the ingest/extract/verify/info commands against a
// temporary store, plus the shared output helpers.
// =============================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

#include "commands/command_common.h"
#include "commands/extract_command.h"
#include "commands/info_command.h"
#include "commands/ingest_command.h"
#include "commands/resolve_command.h"
#include "commands/verify_command.h"
#include "seqchunk/common/error.h"

namespace seqchunk::commands::test {

namespace {

class TempDirGuard {
public:
    TempDirGuard() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("seqchunk_cmd_test_" + std::to_string(counter++) + "_" +
                 std::to_string(std::random_device{}()));
        std::filesystem::create_directories(path_);
    }
    ~TempDirGuard() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDirGuard(const TempDirGuard&) = delete;
    TempDirGuard& operator=(const TempDirGuard&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

StoreOptions tinyChunks() {
    StoreOptions options;
    options.chunkSize = 8;
    return options;
}

}  // namespace

TEST(CommandCommonTest, ToChunkingConfigAppliesSettings) {
    StoreOptions options;
    options.profile = "sqlite";
    options.level = 12;
    options.binary = true;

    auto const config = toChunkingConfig(options);
    EXPECT_EQ(config.profile, StoreProfile::kSqlite);
    EXPECT_EQ(config.chunkSize(), kTableStoreChunkSize);
    EXPECT_EQ(config.codec.level, 12);
    EXPECT_EQ(config.encoding, TextEncoding::kBinary);
}

TEST(CommandCommonTest, ToChunkingConfigRejectsBadSettings) {
    StoreOptions options;
    options.profile = "redis";
    EXPECT_THROW(static_cast<void>(toChunkingConfig(options)), UsageError);

    options.profile = "mongodb";
    options.level = 0;
    EXPECT_THROW(static_cast<void>(toChunkingConfig(options)), UsageError);
}

TEST(CommandCommonTest, JsonQuoteEscapes) {
    EXPECT_EQ(jsonQuote("NC_1.1"), "\"NC_1.1\"");
    EXPECT_EQ(jsonQuote("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(jsonQuote(std::string(1, '\x01')), "\"\\u0001\"");
}

TEST(ExtractCommandTest, WriteFastaWrapsLines) {
    std::ostringstream out;
    writeFasta(out, "seq:0-10", "ACGTACGTAC", 4);
    EXPECT_EQ(out.str(), ">seq:0-10\nACGT\nACGT\nAC\n");

    std::ostringstream single;
    writeFasta(single, "s", "ACGT", 0);
    EXPECT_EQ(single.str(), ">s\nACGT\n");
}

TEST(ResolveCommandTest, JsonOutput) {
    chunk::RangeResolution resolution;
    resolution.sequenceIdentifier = "id";
    resolution.partitions = {"id_0", "id_1"};
    resolution.localStart = 8;
    resolution.localEnd = 17;
    resolution.strand = "+";

    std::ostringstream out;
    printResolutionJson(out, resolution);
    EXPECT_EQ(out.str(),
              "{\n"
              "  \"accession_version\": \"id\",\n"
              "  \"partitions\": [\"id_0\", \"id_1\"],\n"
              "  \"start\": 8,\n"
              "  \"end\": 17,\n"
              "  \"strand\": \"+\"\n"
              "}\n");
}

TEST(CommandRunTest, IngestExtractVerifyInfo) {
    TempDirGuard dir;
    auto const fasta = dir.path() / "input.fa";
    {
        std::ofstream out(fasta);
        out << ">chrA test sequence\nACGTACGTAC\nGGTTAACC\n>chrB\nTTTT\n";
    }
    auto const storePath = dir.path() / "store";

    IngestOptions ingest;
    ingest.inputPath = fasta;
    ingest.storePath = storePath;
    ingest.store = tinyChunks();
    ingest.quiet = true;
    ASSERT_EQ(IngestCommand(ingest).execute(), 0);
    EXPECT_TRUE(std::filesystem::exists(storePath / "chrA_2.sqc"));

    ExtractOptions extract;
    extract.storePath = storePath;
    extract.identifier = "chrA";
    extract.outputPath = dir.path() / "chrA.fa";
    extract.lineWidth = 0;
    extract.store = tinyChunks();
    ASSERT_EQ(ExtractCommand(extract).execute(), 0);
    EXPECT_EQ(readFile(extract.outputPath), ">chrA\nACGTACGTACGGTTAACC\n");

    extract.start = 6;
    extract.end = 12;
    extract.strand = "-";
    extract.outputPath = dir.path() / "range.fa";
    ASSERT_EQ(ExtractCommand(extract).execute(), 0);
    EXPECT_EQ(readFile(extract.outputPath), ">chrA:6-12 strand=-\nGTACGG\n");

    VerifyOptions verify;
    verify.storePath = storePath;
    verify.store = tinyChunks();
    EXPECT_EQ(VerifyCommand(verify).execute(), 0);

    InfoOptions info;
    info.storePath = storePath;
    info.jsonOutput = true;
    EXPECT_EQ(InfoCommand(info).execute(), 0);
}

TEST(CommandRunTest, ExtractUnknownSequenceReturnsNotFound) {
    TempDirGuard dir;
    ExtractOptions extract;
    extract.storePath = dir.path();
    extract.identifier = "absent";
    extract.store = tinyChunks();
    EXPECT_EQ(ExtractCommand(extract).execute(), toExitCode(ErrorCode::kNotFound));
}

TEST(CommandRunTest, VerifyReportsCorruptChunk) {
    TempDirGuard dir;
    auto const fasta = dir.path() / "input.fa";
    {
        std::ofstream out(fasta);
        out << ">s\nACGTACGTACGTACGTACGT\n";
    }

    IngestOptions ingest;
    ingest.inputPath = fasta;
    ingest.storePath = dir.path() / "store";
    ingest.store = tinyChunks();
    ingest.quiet = true;
    ASSERT_EQ(IngestCommand(ingest).execute(), 0);

    // Flip the low byte of the stored checksum of chunk 1.
    auto const record = ingest.storePath / "s_1.sqc";
    std::string bytes = readFile(record);
    ASSERT_GT(bytes.size(), 24u);
    bytes[24] = static_cast<char>(bytes[24] ^ 0x01);
    std::ofstream(record, std::ios::binary | std::ios::trunc) << bytes;

    VerifyOptions verify;
    verify.storePath = ingest.storePath;
    verify.identifier = "s";
    verify.store = tinyChunks();
    EXPECT_EQ(VerifyCommand(verify).execute(), toExitCode(ErrorCode::kChecksumError));
}

TEST(CommandRunTest, VerifyReportsTruncatedRecord) {
    TempDirGuard dir;
    auto const fasta = dir.path() / "input.fa";
    {
        std::ofstream out(fasta);
        out << ">s\nACGTACGTACGTACGTACGT\n";
    }

    IngestOptions ingest;
    ingest.inputPath = fasta;
    ingest.storePath = dir.path() / "store";
    ingest.store = tinyChunks();
    ingest.quiet = true;
    ASSERT_EQ(IngestCommand(ingest).execute(), 0);

    std::ofstream(ingest.storePath / "s_1.sqc", std::ios::binary | std::ios::trunc) << "SQCK";

    VerifyOptions verify;
    verify.storePath = ingest.storePath;
    verify.identifier = "s";
    verify.store = tinyChunks();
    EXPECT_EQ(VerifyCommand(verify).execute(), toExitCode(ErrorCode::kChecksumError));

    // Whole-store verification keeps going past the damaged record too.
    verify.identifier.clear();
    EXPECT_EQ(VerifyCommand(verify).execute(), toExitCode(ErrorCode::kChecksumError));
}

}  // namespace seqchunk::commands::test
