// =============================================================================
// seqchunk - FASTA Reader
// =============================================================================
// Streaming FASTA reader feeding the ingest command.
//
// Format accepted:
//   >identifier optional description
//   ACGT...            (sequence, any number of lines)
//
// Blank lines are skipped and trailing whitespace (including '\r') is
// trimmed. The identifier is the header text up to the first space or tab.
//
// Usage:
//   FastaReader reader("/path/to/genome.fa");
//   while (auto record = reader.readRecord()) {
//       // record->id, record->sequence
//   }
// =============================================================================

#ifndef SEQCHUNK_IO_FASTA_READER_H
#define SEQCHUNK_IO_FASTA_READER_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace seqchunk::io {

/// @brief One FASTA record.
struct FastaRecord {
    /// @brief Identifier (header up to the first whitespace, without '>').
    std::string id;

    /// @brief Remainder of the header line.
    std::string description;

    /// @brief Sequence lines joined without separators.
    std::string sequence;

    [[nodiscard]] bool operator==(const FastaRecord& other) const noexcept = default;
};

/// @brief Streaming FASTA reader.
/// @note Not thread-safe.
class FastaReader {
public:
    /// @brief Read from a file, or from stdin when @p filePath is "-".
    /// @throws IOError if the file cannot be opened.
    explicit FastaReader(const std::filesystem::path& filePath);

    /// @brief Read from an already open stream.
    explicit FastaReader(std::unique_ptr<std::istream> stream);

    FastaReader(const FastaReader&) = delete;
    FastaReader& operator=(const FastaReader&) = delete;
    FastaReader(FastaReader&&) noexcept = default;
    FastaReader& operator=(FastaReader&&) noexcept = default;
    ~FastaReader() = default;

    /// @brief Read the next record.
    /// @return The record, or std::nullopt at end of input.
    /// @throws FormatError on sequence data before the first header or a
    ///         header without identifier.
    [[nodiscard]] std::optional<FastaRecord> readRecord();

    /// @brief Read all remaining records.
    [[nodiscard]] std::vector<FastaRecord> readAll();

    /// @brief Number of lines consumed so far.
    [[nodiscard]] std::uint64_t lineNumber() const noexcept { return lineNumber_; }

    /// @brief Number of records returned so far.
    [[nodiscard]] std::uint64_t recordNumber() const noexcept { return recordNumber_; }

private:
    bool readLine(std::string& line);
    void parseHeader(const std::string& line, FastaRecord& record) const;

    std::string source_;
    std::unique_ptr<std::istream> stream_;
    std::optional<std::string> pendingHeader_;
    std::uint64_t lineNumber_ = 0;
    std::uint64_t recordNumber_ = 0;
};

}  // namespace seqchunk::io

#endif  // SEQCHUNK_IO_FASTA_READER_H
