// =============================================================================
// gzchunk - Timeline Command
// =============================================================================
// Command handler for collecting a filesystem timeline.
//
// Walks a directory tree, streams one TimelineEntry per filesystem entry
// through the chunked gzip encoder and stores the parts with a manifest.
// =============================================================================

#ifndef GZC_COMMANDS_TIMELINE_COMMAND_H
#define GZC_COMMANDS_TIMELINE_COMMAND_H

#include <cstdint>
#include <filesystem>

#include "gzc/common/error.h"
#include "gzc/common/types.h"
#include "gzc/io/compressed_stream.h"

namespace gzc::commands {

// =============================================================================
// Timeline Options
// =============================================================================

/// @brief Configuration options for the timeline command.
struct TimelineOptions {
    /// @brief Directory (or single entry) to walk.
    std::filesystem::path rootPath;

    /// @brief Base path of the part files.
    std::filesystem::path outputBase;

    io::Compression compression{};

    /// @brief Soft ceiling on the compressed size of a part.
    std::uint64_t partSize = kDefaultPartSize;

    /// @brief Descend into directories on other filesystems.
    bool crossDevice = false;

    /// @brief Overwrite an existing part set.
    bool forceOverwrite = false;

    /// @brief Print the summary on completion.
    bool showSummary = true;
};

// =============================================================================
// Timeline Statistics
// =============================================================================

struct TimelineStats {
    std::uint64_t entries = 0;
    std::uint64_t directories = 0;

    /// @brief Entries skipped because they could not be read.
    std::uint64_t walkErrors = 0;

    /// @brief Mount points left unexplored without --cross-device.
    std::uint64_t crossDeviceSkips = 0;

    std::uint32_t partsWritten = 0;

    /// @brief Size of the framed (uncompressed) stream.
    std::uint64_t framedBytes = 0;

    std::uint64_t compressedBytes = 0;

    double elapsedSeconds = 0.0;

    /// @brief Compression ratio (framed/compressed).
    [[nodiscard]] double compressionRatio() const noexcept {
        return compressedBytes > 0 ? static_cast<double>(framedBytes) / compressedBytes : 0.0;
    }
};

// =============================================================================
// TimelineCommand Class
// =============================================================================

class TimelineCommand {
public:
    explicit TimelineCommand(TimelineOptions options);

    ~TimelineCommand();

    // Non-copyable, movable
    TimelineCommand(const TimelineCommand&) = delete;
    TimelineCommand& operator=(const TimelineCommand&) = delete;
    TimelineCommand(TimelineCommand&&) noexcept;
    TimelineCommand& operator=(TimelineCommand&&) noexcept;

    /// @brief Execute the collection.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const TimelineStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const TimelineOptions& options() const noexcept { return options_; }

private:
    void validateOptions();

    void runCollection();

    void printSummary() const;

    TimelineOptions options_;
    TimelineStats stats_;
};

}  // namespace gzc::commands

#endif  // GZC_COMMANDS_TIMELINE_COMMAND_H
