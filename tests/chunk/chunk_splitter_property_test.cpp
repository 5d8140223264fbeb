// =============================================================================
// seqchunk - Chunk Splitter Property Tests
// =============================================================================
// Split/merge round-trip, chunk count, chunk numbering and window contents
// for arbitrary sequences and chunk sizes.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <algorithm>
#include <random>
#include <string>
#include <vector>

#include "seqchunk/chunk/chunk_merger.h"
#include "seqchunk/chunk/chunk_splitter.h"
#include "seqchunk/codec/zstd_codec.h"
#include "seqchunk/common/error.h"

namespace seqchunk::chunk::test {

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

/// @brief Generate a nucleotide sequence, possibly empty.
[[nodiscard]] rc::Gen<std::string> nucleotides() {
    return rc::gen::container<std::string>(rc::gen::element('A', 'C', 'G', 'T', 'N'));
}

/// @brief Generate an accession-like identifier.
[[nodiscard]] rc::Gen<std::string> accession() {
    return rc::gen::map(rc::gen::inRange(1, 1'000'000),
                        [](int n) { return "NC_" + std::to_string(n) + ".1"; });
}

/// @brief Generate a chunk size small enough to produce several chunks.
[[nodiscard]] rc::Gen<ChunkSize> chunkSize() {
    return rc::gen::inRange<ChunkSize>(1, 64);
}

}  // namespace gen

// =============================================================================
// Property Tests
// =============================================================================

RC_GTEST_PROP(ChunkSplitterProperty, MergeRestoresSequence, ()) {
    auto const id = *gen::accession();
    auto const sequence = *rc::gen::nonEmpty(gen::nucleotides());
    auto const size = *gen::chunkSize();

    auto const chunks = ChunkSplitter{}.split(id, sequence, size);
    auto const merged = ChunkMerger{}.merge(chunks);

    RC_ASSERT(merged.sequenceIdentifier == id);
    RC_ASSERT(merged.sequence == sequence);
}

RC_GTEST_PROP(ChunkSplitterProperty, MergeIsOrderIndependent, ()) {
    auto const id = *gen::accession();
    auto const sequence = *rc::gen::nonEmpty(gen::nucleotides());
    auto const size = *gen::chunkSize();
    auto const seed = *rc::gen::arbitrary<unsigned>();

    auto chunks = ChunkSplitter{}.split(id, sequence, size);
    std::mt19937 rng(seed);
    std::shuffle(chunks.begin(), chunks.end(), rng);

    RC_ASSERT(ChunkMerger{}.merge(chunks).sequence == sequence);
}

RC_GTEST_PROP(ChunkSplitterProperty, ChunkCountIsCeilOfLengthOverSize, ()) {
    auto const sequence = *gen::nucleotides();
    auto const size = *gen::chunkSize();

    auto const chunks = ChunkSplitter{}.split("seq", sequence, size);
    RC_ASSERT(chunks.size() == (sequence.size() + size - 1) / size);
    RC_ASSERT(chunks.size() == expectedChunkCount(sequence.size(), size));
}

RC_GTEST_PROP(ChunkSplitterProperty, ChunksAreNumberedContiguously, ()) {
    auto const id = *gen::accession();
    auto const sequence = *gen::nucleotides();
    auto const size = *gen::chunkSize();

    auto const chunks = ChunkSplitter{}.split(id, sequence, size);
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        RC_ASSERT(chunks[i].chunkNumber == i);
        RC_ASSERT(chunks[i].id == makeChunkId(id, i));
        RC_ASSERT(chunks[i].sequenceIdentifier == id);
    }
}

RC_GTEST_PROP(ChunkSplitterProperty, EachChunkHoldsItsWindow, ()) {
    auto const sequence = *rc::gen::nonEmpty(gen::nucleotides());
    auto const size = *gen::chunkSize();

    codec::ZstdCodec const codec;
    auto const chunks = ChunkSplitter{}.split("seq", sequence, size);
    for (const auto& chunk : chunks) {
        auto const restored = codec.decompress(chunk.payload);
        std::string const text(restored.begin(), restored.end());
        RC_ASSERT(text == sequence.substr(chunk.chunkNumber * size, size));
        RC_ASSERT(chunk.rawSize == text.size());
        RC_ASSERT(chunk.checksum == codec::checksum(restored));
        RC_ASSERT(text.size() <= size);
        RC_ASSERT(!text.empty());
    }
}

RC_GTEST_PROP(ChunkSplitterProperty, BinarySequencesRoundTrip, ()) {
    auto const sequence = *rc::gen::nonEmpty(rc::gen::string<std::string>());
    auto const size = *gen::chunkSize();

    SplitterConfig splitConfig;
    splitConfig.encoding = TextEncoding::kBinary;
    MergerConfig mergeConfig;
    mergeConfig.encoding = TextEncoding::kBinary;

    auto const chunks = ChunkSplitter{splitConfig}.split("blob", sequence, size);
    RC_ASSERT(ChunkMerger{mergeConfig}.merge(chunks).sequence == sequence);
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(ChunkSplitterTest, EmptySequenceYieldsNoChunks) {
    EXPECT_TRUE(ChunkSplitter{}.split("seq", "", 10).empty());
}

TEST(ChunkSplitterTest, ExactMultipleHasNoShortChunk) {
    auto const chunks = ChunkSplitter{}.split("seq", std::string(30, 'A'), 10);
    ASSERT_EQ(chunks.size(), 3u);
    for (const auto& chunk : chunks) {
        EXPECT_EQ(chunk.rawSize, 10u);
    }
}

TEST(ChunkSplitterTest, LastChunkMayBeShort) {
    auto const chunks = ChunkSplitter{}.split("seq", std::string(25, 'C'), 10);
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[2].rawSize, 5u);
    EXPECT_EQ(chunks[2].id, "seq_2");
}

TEST(ChunkSplitterTest, DefaultProfileSizesProduceExpectedCounts) {
    std::string const sequence(1'000'000, 'G');
    EXPECT_EQ(ChunkSplitter{}.split("chr", sequence, kDocumentStoreChunkSize).size(), 4u);
    EXPECT_EQ(ChunkSplitter{}.split("chr", sequence, kTableStoreChunkSize).size(), 17u);
}

TEST(ChunkSplitterTest, RejectsZeroSize) {
    EXPECT_THROW(static_cast<void>(ChunkSplitter{}.split("seq", "ACGT", 0)), InvalidRangeError);
}

TEST(ChunkSplitterTest, RejectsEmptyIdentifier) {
    EXPECT_THROW(static_cast<void>(ChunkSplitter{}.split("", "ACGT", 2)), InvalidArgumentError);
}

TEST(ChunkSplitterTest, RejectsNonAsciiText) {
    std::string sequence = "ACGT";
    sequence += static_cast<char>(0xC3);
    sequence += static_cast<char>(0xA9);

    try {
        static_cast<void>(ChunkSplitter{}.split("seq", sequence, 2));
        FAIL() << "expected EncodingError";
    } catch (const EncodingError& e) {
        ASSERT_TRUE(e.context().has_value());
        ASSERT_TRUE(e.context()->chunkNumber.has_value());
        EXPECT_EQ(*e.context()->chunkNumber, 2u);
    }
}

TEST(ChunkSplitterTest, FindUnencodable) {
    std::string text = "ACGT";
    EXPECT_EQ(findUnencodable(text, TextEncoding::kAscii), std::string_view::npos);

    text += static_cast<char>(0x80);
    EXPECT_EQ(findUnencodable(text, TextEncoding::kAscii), 4u);
    EXPECT_EQ(findUnencodable(text, TextEncoding::kBinary), std::string_view::npos);
}

}  // namespace seqchunk::chunk::test
