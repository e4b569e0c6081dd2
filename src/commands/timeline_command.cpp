// =============================================================================
// gzchunk - Timeline Command Implementation
// =============================================================================

#include "timeline_command.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <utility>

#include "gzc/common/logger.h"
#include "gzc/format/gzchunked.h"
#include "gzc/format/part_files.h"
#include "gzc/timeline/timeline_walker.h"

namespace gzc::commands {

// =============================================================================
// TimelineCommand Implementation
// =============================================================================

TimelineCommand::TimelineCommand(TimelineOptions options) : options_(std::move(options)) {}

TimelineCommand::~TimelineCommand() = default;

TimelineCommand::TimelineCommand(TimelineCommand&&) noexcept = default;
TimelineCommand& TimelineCommand::operator=(TimelineCommand&&) noexcept = default;

int TimelineCommand::execute() {
    try {
        validateOptions();

        const auto start = std::chrono::steady_clock::now();
        runCollection();
        const auto end = std::chrono::steady_clock::now();
        stats_.elapsedSeconds = std::chrono::duration<double>(end - start).count();

        if (options_.showSummary) {
            printSummary();
        }

        return 0;

    } catch (const GzcException& e) {
        GZC_LOG_ERROR("Timeline collection failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        GZC_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

void TimelineCommand::validateOptions() {
    if (options_.rootPath.empty()) {
        throw UsageError("timeline root is required");
    }
    if (options_.outputBase.empty()) {
        throw UsageError("output base path is required");
    }
    if (options_.partSize == 0) {
        throw UsageError("part size must be positive");
    }
}

void TimelineCommand::runCollection() {
    timeline::WalkOptions walkOptions;
    walkOptions.oneFileSystem = !options_.crossDevice;
    timeline::TimelineWalker walker(options_.rootPath, walkOptions);

    // Only the root has been stat'ed so far; with --force this removes the
    // previous part set, so a bad root must not get this far.
    format::PartWriter writer(options_.outputBase, options_.forceOverwrite);

    format::EncodeOptions encodeOptions;
    encodeOptions.compression = options_.compression;
    encodeOptions.partSize = options_.partSize;

    GZC_LOG_INFO("Collecting timeline of {} into {}.* (compression={}, part size={})",
                 options_.rootPath.string(), options_.outputBase.string(),
                 options_.compression.name(), options_.partSize);

    format::GzChunkedEncoder encoder([&walker]() { return walker(); }, encodeOptions);

    for (;;) {
        auto part = encoder.nextPart();
        if (!part) {
            part.error().throwException();
        }
        if (!part->has_value()) {
            break;
        }
        writer.writePart(**part);
    }
    writer.finish();

    const auto& walkStats = walker.stats();
    stats_.entries = walkStats.entries;
    stats_.directories = walkStats.directories;
    stats_.walkErrors = walkStats.errors;
    stats_.crossDeviceSkips = walkStats.crossDeviceSkips;
    stats_.partsWritten = encoder.partsProduced();
    stats_.framedBytes = encoder.bytesFramed();
    stats_.compressedBytes = encoder.compressedBytes();

    if (walkStats.errors > 0) {
        GZC_LOG_WARNING("{} entries could not be read and were skipped", walkStats.errors);
    }
}

void TimelineCommand::printSummary() const {
    std::cout << "\n=== Timeline Summary ===" << std::endl;
    std::cout << "  Root:             " << options_.rootPath.string() << std::endl;
    std::cout << "  Entries:          " << stats_.entries << std::endl;
    std::cout << "  Directories:      " << stats_.directories << std::endl;
    std::cout << "  Skipped:          " << stats_.walkErrors << std::endl;
    std::cout << "  Other devices:    " << stats_.crossDeviceSkips << " directories not entered"
              << std::endl;
    std::cout << "  Parts:            " << stats_.partsWritten << std::endl;
    std::cout << "  Framed size:      " << stats_.framedBytes << " bytes" << std::endl;
    std::cout << "  Compressed size:  " << stats_.compressedBytes << " bytes" << std::endl;
    std::cout << "  Compression ratio: " << std::fixed << std::setprecision(2)
              << stats_.compressionRatio() << "x" << std::endl;
    std::cout << "  Elapsed time:     " << std::fixed << std::setprecision(2)
              << stats_.elapsedSeconds << " s" << std::endl;
    std::cout << "========================" << std::endl;
}

}  // namespace gzc::commands
