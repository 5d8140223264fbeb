// =============================================================================
// seqchunk - FASTA Reader Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "seqchunk/common/error.h"
#include "seqchunk/io/fasta_reader.h"

namespace seqchunk::io::test {

namespace {

FastaReader readerFor(std::string text) {
    return FastaReader(std::make_unique<std::istringstream>(std::move(text)));
}

/// @brief Format records with sequences wrapped at @p width.
std::string formatFasta(const std::vector<FastaRecord>& records, std::size_t width) {
    std::ostringstream out;
    for (const auto& record : records) {
        out << '>' << record.id;
        if (!record.description.empty()) {
            out << ' ' << record.description;
        }
        out << '\n';
        for (std::size_t pos = 0; pos < record.sequence.size(); pos += width) {
            out << record.sequence.substr(pos, width) << '\n';
        }
    }
    return out.str();
}

}  // namespace

// =============================================================================
// RapidCheck Generators
// =============================================================================

namespace gen {

[[nodiscard]] rc::Gen<FastaRecord> record() {
    return rc::gen::build<FastaRecord>(
        rc::gen::set(&FastaRecord::id,
                     rc::gen::nonEmpty(rc::gen::container<std::string>(
                         rc::gen::element('A', 'N', 'C', '_', '0', '1', '.')))),
        rc::gen::set(&FastaRecord::description,
                     rc::gen::element(std::string(), std::string("Homo sapiens chromosome 1"))),
        rc::gen::set(&FastaRecord::sequence,
                     rc::gen::container<std::string>(rc::gen::element('A', 'C', 'G', 'T', 'N'))));
}

}  // namespace gen

RC_GTEST_PROP(FastaReaderProperty, ReadsWhatWasWritten, ()) {
    auto const records = *rc::gen::container<std::vector<FastaRecord>>(gen::record());
    auto const width = *rc::gen::inRange<std::size_t>(1, 80);

    auto reader = readerFor(formatFasta(records, width));
    RC_ASSERT(reader.readAll() == records);
    RC_ASSERT(reader.recordNumber() == records.size());
}

// =============================================================================
// Unit Tests
// =============================================================================

TEST(FastaReaderTest, EmptyInputHasNoRecords) {
    auto reader = readerFor("");
    EXPECT_FALSE(reader.readRecord().has_value());
}

TEST(FastaReaderTest, JoinsLinesAndSplitsHeader) {
    auto reader = readerFor(">NC_045512.2 Severe acute respiratory syndrome\nACGT\nTTGA\n>x\nGG\n");

    auto first = reader.readRecord();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->id, "NC_045512.2");
    EXPECT_EQ(first->description, "Severe acute respiratory syndrome");
    EXPECT_EQ(first->sequence, "ACGTTTGA");

    auto second = reader.readRecord();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->id, "x");
    EXPECT_TRUE(second->description.empty());
    EXPECT_EQ(second->sequence, "GG");

    EXPECT_FALSE(reader.readRecord().has_value());
}

TEST(FastaReaderTest, StripsCarriageReturnsAndBlankLines) {
    auto reader = readerFor("\r\n>seq1\r\nAC\r\n\r\nGT\r\n\n");

    auto const records = reader.readAll();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].id, "seq1");
    EXPECT_EQ(records[0].sequence, "ACGT");
}

TEST(FastaReaderTest, HeaderWithoutSequenceIsEmptyRecord) {
    auto const records = readerFor(">a\n>b\nAC\n").readAll();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_TRUE(records[0].sequence.empty());
    EXPECT_EQ(records[1].sequence, "AC");
}

TEST(FastaReaderTest, SequenceBeforeHeaderIsFormatError) {
    auto reader = readerFor("ACGT\n>x\nAC\n");
    EXPECT_THROW(static_cast<void>(reader.readRecord()), FormatError);
}

TEST(FastaReaderTest, EmptyIdentifierIsFormatError) {
    auto reader = readerFor("> description only\nACGT\n");
    EXPECT_THROW(static_cast<void>(reader.readRecord()), FormatError);
}

TEST(FastaReaderTest, MissingFileIsIOError) {
    EXPECT_THROW(FastaReader("/nonexistent/seqchunk/genome.fa"), IOError);
}

}  // namespace seqchunk::io::test
