// =============================================================================
// gzchunk - Filesystem Timeline Walker
// =============================================================================
// Lazy depth-first traversal producing one TimelineEntry per filesystem
// entry. The walker is a record producer, so it plugs straight into
// GzChunkedEncoder and the tree is never held in memory.
//
// Usage:
//   gzc::timeline::TimelineWalker walker("/etc");
//   gzc::format::GzChunkedEncoder encoder(std::move(walker), options);
// =============================================================================

#ifndef GZC_TIMELINE_TIMELINE_WALKER_H
#define GZC_TIMELINE_TIMELINE_WALKER_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "gzc/timeline/timeline_entry.h"

namespace gzc::timeline {

struct WalkOptions {
    /// @brief Do not descend into directories on a different device than the
    ///        root (they are still reported themselves).
    bool oneFileSystem = true;
};

struct WalkStats {
    std::uint64_t entries = 0;
    std::uint64_t directories = 0;
    /// @brief Entries that could not be stat'ed or directories that could
    ///        not be listed.
    std::uint64_t errors = 0;
    /// @brief Directories not descended into because of oneFileSystem.
    std::uint64_t crossDeviceSkips = 0;
};

/// @brief Depth-first filesystem walker; the root is reported first.
///
/// Symlinks are reported but never followed. Entries that vanish or cannot
/// be read while walking are logged, counted and skipped.
class TimelineWalker {
public:
    /// @throws IOError(kFileNotFound) if the root cannot be stat'ed.
    explicit TimelineWalker(std::filesystem::path root, WalkOptions options = {});

    /// @brief Next entry, std::nullopt once the walk is complete.
    [[nodiscard]] std::optional<TimelineEntry> operator()();

    [[nodiscard]] const WalkStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    /// @brief lstat(path), counting and logging failures.
    std::optional<TimelineEntry> statEntry(const std::filesystem::path& path);

    /// @brief Queue a directory's children, respecting oneFileSystem.
    void enter(const TimelineEntry& directory);

    std::filesystem::path root_;
    WalkOptions options_;
    std::uint64_t rootDevice_ = 0;
    std::optional<TimelineEntry> pendingRoot_;
    std::vector<std::filesystem::directory_iterator> stack_;
    WalkStats stats_;
};

}  // namespace gzc::timeline

#endif  // GZC_TIMELINE_TIMELINE_WALKER_H
