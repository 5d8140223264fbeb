// =============================================================================
// seqchunk - Chunked Sequence Store
// =============================================================================
// Main entry point for the seqchunk command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: ingest, extract, resolve, verify, info
// - Global options: verbosity, log file, INI configuration file
//
// Every option may also be given in the configuration file, with subcommand
// options in a section named after the subcommand:
//
//   [ingest]
//   profile = azure
//   level = 9
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "seqchunk/common/error.h"
#include "seqchunk/common/logger.h"
#include "seqchunk/common/types.h"

#include "commands/extract_command.h"
#include "commands/info_command.h"
#include "commands/ingest_command.h"
#include "commands/resolve_command.h"
#include "commands/verify_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "seqchunk: chunked, compressed storage of long biological sequences\n"
    "Sequences are split into fixed-size zstd-compressed chunks keyed by\n"
    "'{accession}_{chunk}' so that any range can be read back by fetching\n"
    "only the chunks that cover it.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = info, 1 = debug, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

seqchunk::commands::IngestOptions gIngestOpts;
seqchunk::commands::ExtractOptions gExtractOpts;
seqchunk::commands::ResolveOptions gResolveOpts;
seqchunk::commands::VerifyOptions gVerifyOpts;
seqchunk::commands::InfoOptions gInfoOpts;

// Range options are plain values; presence is read back from the option.
seqchunk::SeqPos gExtractStart = 0;
seqchunk::SeqPos gExtractEnd = 0;
std::string gExtractStrand;
std::string gResolveStrand;

// =============================================================================
// Command Setup Functions
// =============================================================================

void addStoreOptions(CLI::App* cmd, seqchunk::commands::StoreOptions& opts) {
    cmd->add_option("-p,--profile", opts.profile,
                    "Backing-store profile: mongodb, azure, mariadb, sqlite")
        ->default_val("mongodb");

    cmd->add_option("--chunk-size", opts.chunkSize,
                    "Chunk size in bytes (0 = profile default)")
        ->default_val(0)
        ->check(CLI::NonNegativeNumber);
}

void setupIngestCommand(CLI::App& app) {
    auto* ingest = app.add_subcommand("ingest", "Split FASTA sequences into a chunk store");

    ingest->add_option("-i,--input", gIngestOpts.inputPath, "Input FASTA file (or '-' for stdin)")
        ->required();

    ingest->add_option("-s,--store", gIngestOpts.storePath, "Store directory")->required();

    addStoreOptions(ingest, gIngestOpts.store);

    ingest->add_option("-l,--level", gIngestOpts.store.level, "Zstd compression level")
        ->default_val(seqchunk::kDefaultZstdLevel)
        ->check(CLI::Range(seqchunk::kMinZstdLevel, seqchunk::kMaxZstdLevel));

    ingest->add_flag("--binary", gIngestOpts.store.binary,
                     "Accept arbitrary bytes instead of ASCII text");
}

CLI::Option* gExtractStartOpt = nullptr;
CLI::Option* gExtractStrandOpt = nullptr;
CLI::Option* gResolveStrandOpt = nullptr;

void setupExtractCommand(CLI::App& app) {
    auto* extract = app.add_subcommand("extract", "Write a stored sequence or range as FASTA");
    extract->alias("x");

    extract->add_option("-s,--store", gExtractOpts.storePath, "Store directory")
        ->required()
        ->check(CLI::ExistingDirectory);

    extract->add_option("--id", gExtractOpts.identifier, "Sequence identifier")->required();

    gExtractStartOpt = extract->add_option("--start", gExtractStart, "Range start (0-based)");
    auto* endOpt = extract->add_option("--end", gExtractEnd, "Range end (exclusive)");
    gExtractStartOpt->needs(endOpt);
    endOpt->needs(gExtractStartOpt);

    gExtractStrandOpt =
        extract->add_option("--strand", gExtractStrand, "Strand tag for the output header");

    extract->add_option("-o,--output", gExtractOpts.outputPath,
                        "Output FASTA file (default: stdout)");

    extract->add_option("-w,--line-width", gExtractOpts.lineWidth,
                        "FASTA line width (0 = single line)")
        ->default_val(60);

    addStoreOptions(extract, gExtractOpts.store);
    extract->add_flag("--binary", gExtractOpts.store.binary, "Stored sequences are binary");
}

void setupResolveCommand(CLI::App& app) {
    auto* resolve = app.add_subcommand("resolve", "Show the chunks covering a range");

    resolve->add_option("--id", gResolveOpts.identifier, "Sequence identifier")->required();
    resolve->add_option("--start", gResolveOpts.start, "Range start (0-based)")->required();
    resolve->add_option("--end", gResolveOpts.end, "Range end (exclusive)")->required();
    gResolveStrandOpt = resolve->add_option("--strand", gResolveStrand, "Strand tag");

    addStoreOptions(resolve, gResolveOpts.store);

    resolve->add_flag("--json", gResolveOpts.jsonOutput, "Output as JSON");
}

void setupVerifyCommand(CLI::App& app) {
    auto* verify = app.add_subcommand("verify", "Check stored chunks for damage and gaps");
    verify->alias("v");

    verify->add_option("-s,--store", gVerifyOpts.storePath, "Store directory")
        ->required()
        ->check(CLI::ExistingDirectory);

    verify->add_option("--id", gVerifyOpts.identifier,
                       "Sequence identifier (default: every stored sequence)");

    verify->add_flag("--fail-fast", gVerifyOpts.failFast, "Stop at the first damaged sequence");

    addStoreOptions(verify, gVerifyOpts.store);
    verify->add_flag("--binary", gVerifyOpts.store.binary, "Stored sequences are binary");
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "List stored sequences");
    info->alias("i");

    info->add_option("-s,--store", gInfoOpts.storePath, "Store directory")
        ->required()
        ->check(CLI::ExistingDirectory);

    info->add_flag("--json", gInfoOpts.jsonOutput, "Output as JSON");
}

// =============================================================================
// Command Dispatch
// =============================================================================

int runIngest() {
    gIngestOpts.quiet = gOptions.quiet;
    seqchunk::commands::IngestCommand cmd(gIngestOpts);
    return cmd.execute();
}

int runExtract() {
    if (gExtractStartOpt->count() > 0) {
        gExtractOpts.start = gExtractStart;
        gExtractOpts.end = gExtractEnd;
    }
    if (gExtractStrandOpt->count() > 0) {
        gExtractOpts.strand = gExtractStrand;
    }
    seqchunk::commands::ExtractCommand cmd(gExtractOpts);
    return cmd.execute();
}

int runResolve() {
    if (gResolveStrandOpt->count() > 0) {
        gResolveOpts.strand = gResolveStrand;
    }
    seqchunk::commands::ResolveCommand cmd(gResolveOpts);
    return cmd.execute();
}

int runVerify() {
    seqchunk::commands::VerifyCommand cmd(gVerifyOpts);
    return cmd.execute();
}

int runInfo() {
    seqchunk::commands::InfoCommand cmd(gInfoOpts);
    return cmd.execute();
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);
    app.set_config("--config", "", "INI configuration file");

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v debug, -vv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupIngestCommand(app);
    setupExtractCommand(app);
    setupResolveCommand(app);
    setupVerifyCommand(app);
    setupInfoCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        seqchunk::log::Config logConfig;
        logConfig.logFile = gOptions.logFile;
        logConfig.level = seqchunk::log::levelForVerbosity(gOptions.verbosity, gOptions.quiet);
        seqchunk::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("ingest")) {
            exitCode = runIngest();
        } else if (app.got_subcommand("extract")) {
            exitCode = runExtract();
        } else if (app.got_subcommand("resolve")) {
            exitCode = runResolve();
        } else if (app.got_subcommand("verify")) {
            exitCode = runVerify();
        } else if (app.got_subcommand("info")) {
            exitCode = runInfo();
        }
    } catch (const seqchunk::SeqChunkException& ex) {
        SEQCHUNK_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        SEQCHUNK_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    seqchunk::log::shutdown();
    return exitCode;
}
