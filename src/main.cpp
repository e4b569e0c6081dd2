// =============================================================================
// gzchunk - Chunked Gzip Transfer Tool
// =============================================================================
// Entry point of the gzc command-line tool.
//
//   gzc timeline -r <root> -o <base>   walk a tree into <base>.N parts
//   gzc dump -i <base>                 decode the parts and print entries
//   gzc verify -i <base>               check sizes, checksums and decoding
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include "commands/dump_command.h"
#include "commands/timeline_command.h"
#include "commands/verify_command.h"
#include "gzc/common/error.h"
#include "gzc/common/logger.h"
#include "gzc/io/compressed_stream.h"

namespace {

constexpr const char* kVersion = "0.1.0";

struct Arguments {
    int verbosity = 0;
    bool quiet = false;
    std::string logFile;

    std::string root;
    std::string base;
    std::string compression = "default";

    gzc::commands::TimelineOptions timeline;
    gzc::commands::DumpOptions dump;
    gzc::commands::VerifyOptions verify;
};

gzc::log::Level logLevel(const Arguments& args) {
    if (args.quiet) {
        return gzc::log::Level::kError;
    }
    switch (args.verbosity) {
        case 0:
            return gzc::log::Level::kInfo;
        case 1:
            return gzc::log::Level::kDebug;
        default:
            return gzc::log::Level::kTrace;
    }
}

void addTimeline(CLI::App& app, Arguments& args) {
    auto* cmd = app.add_subcommand("timeline", "Collect a filesystem timeline into parts");
    cmd->alias("t");
    cmd->add_option("-r,--root", args.root, "Root of the tree to walk")
        ->required()
        ->check(CLI::ExistingPath);
    cmd->add_option("-o,--output", args.base,
                    "Base path of the parts (<base>.0, <base>.1, ..., <base>.manifest)")
        ->required();
    cmd->add_option("-c,--compression", args.compression,
                    "none, fast, default, best or a level 0-9")
        ->capture_default_str();
    cmd->add_option("-s,--part-size", args.timeline.partSize,
                    "Soft ceiling on the compressed size of a part, in bytes")
        ->capture_default_str()
        ->check(CLI::PositiveNumber);
    cmd->add_flag("--cross-device", args.timeline.crossDevice,
                  "Descend into directories on other filesystems");
    cmd->add_flag("-f,--force", args.timeline.forceOverwrite, "Overwrite an existing part set");
}

void addDump(CLI::App& app, Arguments& args) {
    auto* cmd = app.add_subcommand("dump", "Decode stored parts and print the entries");
    cmd->alias("d");
    cmd->add_option("-i,--input", args.base, "Base path of the parts")->required();
    cmd->add_option("--limit", args.dump.limit, "Print at most N entries (0 = all)")
        ->capture_default_str();
    cmd->add_flag("--json", args.dump.jsonOutput, "One JSON object per line");
}

void addVerify(CLI::App& app, Arguments& args) {
    auto* cmd = app.add_subcommand("verify", "Verify stored parts");
    cmd->alias("v");
    cmd->add_option("-i,--input", args.base, "Base path of the parts")->required();
    cmd->add_flag("--fail-fast", args.verify.failFast, "Stop at the first failed check");
    cmd->add_flag("--verbose", args.verify.verbose, "Print every check as it completes");
}

int dispatch(CLI::App& app, Arguments& args) {
    using namespace gzc::commands;

    if (app.got_subcommand("timeline")) {
        args.timeline.rootPath = args.root;
        args.timeline.outputBase = args.base;
        args.timeline.compression = gzc::unwrapOrThrow(gzc::io::parseCompression(args.compression));
        args.timeline.showSummary = !args.quiet;
        return TimelineCommand(std::move(args.timeline)).execute();
    }
    if (app.got_subcommand("dump")) {
        args.dump.inputBase = args.base;
        return DumpCommand(std::move(args.dump), std::cout).execute();
    }
    args.verify.inputBase = args.base;
    args.verify.showSummary = !args.quiet;
    return VerifyCommand(std::move(args.verify)).execute();
}

}  // namespace

int main(int argc, char* argv[]) {
    Arguments args;

    CLI::App app{"gzc: streaming chunked gzip transfer of record sequences"};
    app.set_version_flag("-V,--version", kVersion);
    app.add_flag("-v,--verbose", args.verbosity, "Increase verbosity (-v debug, -vv trace)");
    app.add_flag("-q,--quiet", args.quiet, "Only log errors");
    app.add_option("--log-file", args.logFile, "Also write the log to this file");

    addTimeline(app, args);
    addDump(app, args);
    addVerify(app, args);
    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    try {
        gzc::log::Config config;
        config.logFile = args.logFile;
        config.level = logLevel(args);
        gzc::log::init(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    int exitCode = EXIT_SUCCESS;
    try {
        exitCode = dispatch(app, args);
    } catch (const gzc::GzcException& e) {
        GZC_LOG_ERROR("{}", e.what());
        exitCode = e.exitCode();
    } catch (const std::exception& e) {
        GZC_LOG_ERROR("Unexpected error: {}", e.what());
        exitCode = gzc::toExitCode(gzc::ErrorCode::kIOError);
    }

    gzc::log::shutdown();
    return exitCode;
}
