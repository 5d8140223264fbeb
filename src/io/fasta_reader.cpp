// =============================================================================
// seqchunk - FASTA Reader Implementation
// =============================================================================

#include "seqchunk/io/fasta_reader.h"

#include <fstream>
#include <iostream>
#include <string_view>

#include <fmt/format.h>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"

namespace seqchunk::io {

namespace {

void trimRight(std::string& line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
}

}  // namespace

FastaReader::FastaReader(const std::filesystem::path& filePath) : source_(filePath.string()) {
    if (filePath == "-") {
        stream_ = std::make_unique<std::istream>(std::cin.rdbuf());
        SEQCHUNK_LOG_DEBUG("Reading FASTA from stdin");
        return;
    }

    auto file = std::make_unique<std::ifstream>(filePath, std::ios::binary);
    if (!file->is_open()) {
        throw IOError("Failed to open FASTA file", ErrorContext().withFile(source_));
    }
    stream_ = std::move(file);
    SEQCHUNK_LOG_DEBUG("Opened FASTA file: {}", source_);
}

FastaReader::FastaReader(std::unique_ptr<std::istream> stream)
    : source_("<stream>"), stream_(std::move(stream)) {}

bool FastaReader::readLine(std::string& line) {
    if (!stream_ || !std::getline(*stream_, line)) {
        if (stream_ && stream_->bad()) {
            throw IOError(fmt::format("Read failure after line {}", lineNumber_),
                          ErrorContext().withFile(source_));
        }
        return false;
    }
    ++lineNumber_;
    trimRight(line);
    return true;
}

void FastaReader::parseHeader(const std::string& line, FastaRecord& record) const {
    std::string_view header(line);
    header.remove_prefix(1);  // '>'

    auto const split = header.find_first_of(" \t");
    record.id = std::string(header.substr(0, split));
    if (split != std::string_view::npos) {
        auto description = header.substr(split + 1);
        auto const begin = description.find_first_not_of(" \t");
        record.description =
            begin == std::string_view::npos ? std::string() : std::string(description.substr(begin));
    }

    if (record.id.empty()) {
        throw FormatError(fmt::format("Invalid FASTA header at line {}: empty identifier",
                                      lineNumber_),
                          ErrorContext().withFile(source_));
    }
}

std::optional<FastaRecord> FastaReader::readRecord() {
    std::string line;

    if (pendingHeader_) {
        line = std::move(*pendingHeader_);
        pendingHeader_.reset();
    } else {
        do {
            if (!readLine(line)) {
                return std::nullopt;
            }
        } while (line.empty());

        if (line.front() != '>') {
            throw FormatError(
                fmt::format("Invalid FASTA format at line {}: sequence data before the first "
                            "header",
                            lineNumber_),
                ErrorContext().withFile(source_));
        }
    }

    FastaRecord record;
    parseHeader(line, record);

    while (readLine(line)) {
        if (line.empty()) {
            continue;
        }
        if (line.front() == '>') {
            pendingHeader_ = std::move(line);
            break;
        }
        record.sequence.append(line);
    }

    ++recordNumber_;
    return record;
}

std::vector<FastaRecord> FastaReader::readAll() {
    std::vector<FastaRecord> records;
    while (auto record = readRecord()) {
        records.push_back(std::move(*record));
    }
    return records;
}

}  // namespace seqchunk::io
