// =============================================================================
// seqchunk - Sequence Store Tests
// =============================================================================
// Ingest/fetch/range/verify through the SequenceStore facade, run against
// both the in-memory and the directory chunk store.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <span>
#include <string>
#include <string_view>

#include "seqchunk/common/error.h"
#include "seqchunk/store/directory_chunk_store.h"
#include "seqchunk/store/memory_chunk_store.h"
#include "seqchunk/store/sequence_store.h"

namespace seqchunk::store::test {

// =============================================================================
// Test Utilities
// =============================================================================

/// @brief Generate a unique temporary directory path.
[[nodiscard]] std::filesystem::path tempDirPath() {
    static std::atomic<int> counter{0};
    return std::filesystem::temp_directory_path() /
           ("seqchunk_test_" + std::to_string(counter++) + "_" +
            std::to_string(std::random_device{}()));
}

/// @brief RAII cleanup for temporary directories.
class TempDirGuard {
public:
    TempDirGuard() : path_(tempDirPath()) {}
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

/// @brief Deterministic pseudo-random nucleotide text.
[[nodiscard]] std::string makeSequence(std::size_t length, unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::string sequence(length, 'A');
    for (auto& base : sequence) {
        base = "ACGT"[rng() % 4];
    }
    return sequence;
}

/// @brief Chunking config with a small chunk size so sequences span many chunks.
[[nodiscard]] config::ChunkingConfig smallChunks(ChunkSize size = 10) {
    config::ChunkingConfig config;
    config.chunkSizeOverride = size;
    return config;
}

// =============================================================================
// Fixture over both store implementations
// =============================================================================

enum class Backend { kMemory, kDirectory };

class SequenceStoreTest : public ::testing::TestWithParam<Backend> {
protected:
    void SetUp() override {
        if (GetParam() == Backend::kMemory) {
            chunkStore_ = std::make_unique<MemoryChunkStore>();
        } else {
            chunkStore_ = std::make_unique<DirectoryChunkStore>(dir_.path());
        }
        store_ = std::make_unique<SequenceStore>(smallChunks(), *chunkStore_);
    }

    TempDirGuard dir_;
    std::unique_ptr<ChunkStore> chunkStore_;
    std::unique_ptr<SequenceStore> store_;
};

TEST_P(SequenceStoreTest, IngestThenFetchRestoresSequence) {
    auto const sequence = makeSequence(95);
    auto const summary = store_->ingest("NC_045512.2", sequence);

    EXPECT_EQ(summary.chunkCount, 10u);
    EXPECT_EQ(summary.rawBytes, 95u);
    EXPECT_GT(summary.compressedBytes, 0u);
    EXPECT_EQ(summary.staleChunks, 0u);

    auto const merged = store_->fetch("NC_045512.2");
    EXPECT_EQ(merged.sequenceIdentifier, "NC_045512.2");
    EXPECT_EQ(merged.sequence, sequence);
}

TEST_P(SequenceStoreTest, ReingestReplacesPreviousVersion) {
    store_->ingest("seq", makeSequence(95, 1));
    auto const shorter = makeSequence(31, 2);
    auto const summary = store_->ingest("seq", shorter);

    // seq_0..seq_3 are overwritten, seq_4..seq_9 are stale.
    EXPECT_EQ(summary.staleChunks, 6u);
    EXPECT_EQ(store_->fetch("seq").sequence, shorter);
    EXPECT_EQ(store_->describe("seq").chunkCount, 4u);
}

TEST_P(SequenceStoreTest, LongerReingestLeavesNothingStale) {
    store_->ingest("seq", makeSequence(31, 1));
    auto const longer = makeSequence(95, 2);
    auto const summary = store_->ingest("seq", longer);

    EXPECT_EQ(summary.staleChunks, 0u);
    EXPECT_EQ(store_->fetch("seq").sequence, longer);
    EXPECT_TRUE(store_->verify("seq").ok());
}

TEST_P(SequenceStoreTest, FetchUnknownSequenceIsNotFound) {
    EXPECT_THROW(static_cast<void>(store_->fetch("missing")), NotFoundError);
    EXPECT_THROW(static_cast<void>(store_->verify("missing")), NotFoundError);
}

TEST_P(SequenceStoreTest, FetchRangeReadsOnlyTheRange) {
    auto const sequence = makeSequence(95);
    store_->ingest("seq", sequence);

    auto const result = store_->fetchRange({"seq", 8, 17, std::string("-")});
    EXPECT_EQ(result.sequence, sequence.substr(8, 9));
    EXPECT_EQ(result.resolution.partitions, (std::vector<std::string>{"seq_0", "seq_1"}));
    EXPECT_EQ(result.resolution.strand, std::optional<std::string>("-"));
}

TEST_P(SequenceStoreTest, FetchRangeEndingAtSequenceEnd) {
    auto const sequence = makeSequence(40);
    store_->ingest("seq", sequence);

    // seq_4 would be listed but does not exist.
    auto const result = store_->fetchRange({"seq", 25, 40, std::nullopt});
    EXPECT_EQ(result.sequence, sequence.substr(25));
}

TEST_P(SequenceStoreTest, FetchRangePastEndIsInvalid) {
    store_->ingest("seq", makeSequence(25));

    EXPECT_THROW(static_cast<void>(store_->fetchRange({"seq", 20, 28, std::nullopt})),
                 InvalidRangeError);
    EXPECT_THROW(static_cast<void>(store_->fetchRange({"seq", 40, 45, std::nullopt})),
                 NotFoundError);
}

TEST_P(SequenceStoreTest, FetchRangeRejectsReversedRange) {
    store_->ingest("seq", makeSequence(25));
    EXPECT_THROW(static_cast<void>(store_->fetchRange({"seq", 9, 3, std::nullopt})),
                 InvalidRangeError);
}

TEST_P(SequenceStoreTest, VerifyReportsIntactSequence) {
    store_->ingest("seq", makeSequence(55));

    auto const report = store_->verify("seq");
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.info.chunkCount, 6u);
    EXPECT_EQ(report.info.rawBytes, 55u);
    EXPECT_EQ(report.info.lastChunk, 5u);
}

TEST_P(SequenceStoreTest, ListsStoredSequences) {
    store_->ingest("b", makeSequence(12));
    store_->ingest("a", makeSequence(3));
    store_->ingest("empty", "");

    EXPECT_EQ(store_->listSequences(), (std::vector<std::string>{"a", "b"}));
}

INSTANTIATE_TEST_SUITE_P(Backends, SequenceStoreTest,
                         ::testing::Values(Backend::kMemory, Backend::kDirectory),
                         [](const ::testing::TestParamInfo<Backend>& info) {
                             return info.param == Backend::kMemory ? "Memory" : "Directory";
                         });

// =============================================================================
// Damage detection (memory store, chunks edited in place)
// =============================================================================

TEST(SequenceStoreDamageTest, MissingChunkBreaksFetchAndShowsInVerify) {
    MemoryChunkStore chunks;
    SequenceStore store(smallChunks(), chunks);
    store.ingest("seq", makeSequence(50));
    ASSERT_TRUE(chunks.remove("seq_2"));

    EXPECT_THROW(static_cast<void>(store.fetch("seq")), IncompleteChunkSetError);
    EXPECT_THROW(static_cast<void>(store.fetchRange({"seq", 15, 35, std::nullopt})),
                 NotFoundError);

    auto const report = store.verify("seq");
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.missingChunks, (std::vector<ChunkNumber>{2}));
    EXPECT_TRUE(report.corruptChunks.empty());
}

TEST(SequenceStoreDamageTest, MissingLeadingChunkShowsInVerify) {
    MemoryChunkStore chunks;
    SequenceStore store(smallChunks(), chunks);
    store.ingest("seq", makeSequence(30));
    ASSERT_TRUE(chunks.remove("seq_0"));

    EXPECT_EQ(store.verify("seq").missingChunks, (std::vector<ChunkNumber>{0}));
}

TEST(SequenceStoreDamageTest, CorruptChunkShowsInVerify) {
    MemoryChunkStore chunks;
    SequenceStore store(smallChunks(), chunks);
    store.ingest("seq", makeSequence(30));

    std::vector<std::string> const ids = {"seq_1"};
    auto damaged = chunks.fetch(ids);
    ASSERT_EQ(damaged.size(), 1u);
    damaged[0].checksum ^= 0x5A;
    chunks.store(damaged);

    EXPECT_THROW(static_cast<void>(store.fetch("seq")), ChecksumError);

    auto const report = store.verify("seq");
    EXPECT_EQ(report.corruptChunks, (std::vector<ChunkNumber>{1}));
    EXPECT_TRUE(report.missingChunks.empty());
}

/// @brief Writer whose store() always fails, removal goes to the wrapped store.
class FailingWriter : public ChunkWriter {
public:
    explicit FailingWriter(ChunkWriter& inner) : inner_(inner) {}

    void store(std::span<const chunk::Chunk> /*chunks*/) override {
        throw IOError("disk full");
    }

    std::size_t removeChunksFrom(std::string_view identifier, ChunkNumber firstChunk) override {
        return inner_.removeChunksFrom(identifier, firstChunk);
    }

private:
    ChunkWriter& inner_;
};

TEST(SequenceStoreDamageTest, FailedReingestKeepsPreviousVersion) {
    MemoryChunkStore chunks;
    auto const original = makeSequence(45, 1);
    SequenceStore(smallChunks(), chunks).ingest("seq", original);

    FailingWriter writer(chunks);
    SequenceStore store(smallChunks(), chunks, writer);
    EXPECT_THROW(static_cast<void>(store.ingest("seq", makeSequence(20, 2))), IOError);

    EXPECT_EQ(store.fetch("seq").sequence, original);
    EXPECT_EQ(chunks.size(), 5u);
}

TEST(SequenceStoreDamageTest, InvalidConfigIsUsageError) {
    MemoryChunkStore chunks;
    EXPECT_THROW(static_cast<void>(SequenceStore(smallChunks(0), chunks)), UsageError);
}

// =============================================================================
// Directory store specifics
// =============================================================================

TEST(DirectoryChunkStoreTest, WritesOneRecordFilePerChunk) {
    TempDirGuard dir;
    DirectoryChunkStore chunks(dir.path());
    SequenceStore store(smallChunks(), chunks);
    store.ingest("NC_1.1", makeSequence(25));

    EXPECT_TRUE(std::filesystem::exists(dir.path() / "NC_1.1_0.sqc"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "NC_1.1_2.sqc"));
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "NC_1.1_3.sqc"));
    EXPECT_EQ(chunks.pathFor("NC_1.1_0"), dir.path() / "NC_1.1_0.sqc");
}

TEST(DirectoryChunkStoreTest, ReopenedStoreSeesPreviousWrites) {
    TempDirGuard dir;
    auto const sequence = makeSequence(64);
    {
        DirectoryChunkStore chunks(dir.path());
        SequenceStore(smallChunks(), chunks).ingest("seq", sequence);
    }

    DirectoryChunkStore reopened(dir.path());
    EXPECT_EQ(SequenceStore(smallChunks(), reopened).fetch("seq").sequence, sequence);
}

TEST(DirectoryChunkStoreTest, IgnoresForeignFiles) {
    TempDirGuard dir;
    DirectoryChunkStore chunks(dir.path());
    SequenceStore store(smallChunks(), chunks);
    store.ingest("seq", makeSequence(15));

    std::ofstream(dir.path() / "notes.txt") << "hello";
    std::ofstream(dir.path() / "nochunknumber.sqc") << "junk";

    EXPECT_EQ(store.listSequences(), (std::vector<std::string>{"seq"}));
}

TEST(DirectoryChunkStoreTest, DamagedRecordIsFormatError) {
    TempDirGuard dir;
    DirectoryChunkStore chunks(dir.path());
    SequenceStore store(smallChunks(), chunks);
    store.ingest("seq", makeSequence(15));

    std::ofstream(dir.path() / "seq_1.sqc", std::ios::binary | std::ios::trunc) << "SQCK";

    EXPECT_THROW(static_cast<void>(store.fetch("seq")), FormatError);
}

TEST(DirectoryChunkStoreTest, DamagedRecordShowsInVerify) {
    TempDirGuard dir;
    DirectoryChunkStore chunks(dir.path());
    SequenceStore store(smallChunks(), chunks);
    store.ingest("seq", makeSequence(15));

    std::ofstream(dir.path() / "seq_1.sqc", std::ios::binary | std::ios::trunc) << "SQCK";

    auto const report = store.verify("seq");
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.corruptChunks, (std::vector<ChunkNumber>{1}));
    EXPECT_TRUE(report.missingChunks.empty());
    EXPECT_EQ(report.info.chunkCount, 2u);
    EXPECT_EQ(report.info.lastChunk, 1u);
}

TEST(DirectoryChunkStoreTest, RecordUnderWrongFileNameIsDamaged) {
    TempDirGuard dir;
    DirectoryChunkStore chunks(dir.path());
    SequenceStore store(smallChunks(), chunks);
    store.ingest("seq", makeSequence(15));

    std::filesystem::copy_file(dir.path() / "seq_0.sqc", dir.path() / "seq_2.sqc");

    EXPECT_THROW(static_cast<void>(store.fetch("seq")), FormatError);
    EXPECT_EQ(store.verify("seq").corruptChunks, (std::vector<ChunkNumber>{2}));
}

TEST(DirectoryChunkStoreTest, RejectsIdsThatAreNotFileNames) {
    TempDirGuard dir;
    DirectoryChunkStore chunks(dir.path());
    EXPECT_THROW(static_cast<void>(chunks.pathFor("../escape_0")), InvalidArgumentError);
    EXPECT_THROW(static_cast<void>(chunks.pathFor("")), InvalidArgumentError);
}

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(SequenceStoreProperty, AnyRangeMatchesSubstring, ()) {
    auto const length = *rc::gen::inRange<std::size_t>(1, 300);
    auto const size = *rc::gen::inRange<ChunkSize>(1, 50);
    auto const start = *rc::gen::inRange<SeqPos>(0, length);
    auto const end = *rc::gen::inRange<SeqPos>(start + 1, length + 1);
    auto const sequence = makeSequence(length, static_cast<unsigned>(length));

    MemoryChunkStore chunks;
    SequenceStore store(smallChunks(size), chunks);
    store.ingest("seq", sequence);

    RC_ASSERT(store.fetchRange({"seq", start, end, std::nullopt}).sequence ==
              sequence.substr(start, end - start));
}

}  // namespace seqchunk::store::test
