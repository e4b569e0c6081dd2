// =============================================================================
// gzchunk - Filesystem Timeline Walker Implementation
// =============================================================================

#include "gzc/timeline/timeline_walker.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

#include "gzc/common/error.h"
#include "gzc/common/logger.h"

namespace gzc::timeline {

TimelineWalker::TimelineWalker(std::filesystem::path root, WalkOptions options)
    : root_(std::move(root)), options_(options) {
    struct ::stat st {};
    if (::lstat(root_.c_str(), &st) != 0) {
        const std::error_code ec(errno, std::generic_category());
        throw IOError(ErrorCode::kFileNotFound,
                      "Cannot stat timeline root: " + root_.string() + " (" + ec.message() + ")",
                      ErrorContext(root_.string()));
    }

    pendingRoot_ = TimelineEntry::fromStat(root_.string(), st);
    rootDevice_ = pendingRoot_->device;
}

std::optional<TimelineEntry> TimelineWalker::operator()() {
    if (pendingRoot_) {
        TimelineEntry entry = std::move(*pendingRoot_);
        pendingRoot_.reset();
        ++stats_.entries;
        if (entry.isDirectory()) {
            ++stats_.directories;
            enter(entry);
        }
        return entry;
    }

    while (!stack_.empty()) {
        auto& iterator = stack_.back();
        if (iterator == std::filesystem::directory_iterator()) {
            stack_.pop_back();
            continue;
        }

        std::filesystem::path path = iterator->path();

        std::error_code ec;
        iterator.increment(ec);
        if (ec) {
            GZC_LOG_WARNING("Stopped listing {}: {}", path.parent_path().string(), ec.message());
            ++stats_.errors;
            stack_.pop_back();
        }

        auto entry = statEntry(path);
        if (!entry) {
            continue;
        }

        ++stats_.entries;
        if (entry->isDirectory()) {
            ++stats_.directories;
            enter(*entry);
        }
        return entry;
    }

    return std::nullopt;
}

std::optional<TimelineEntry> TimelineWalker::statEntry(const std::filesystem::path& path) {
    struct ::stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        GZC_LOG_WARNING("Skipping {}: {}", path.string(), std::strerror(errno));
        ++stats_.errors;
        return std::nullopt;
    }
    return TimelineEntry::fromStat(path.string(), st);
}

void TimelineWalker::enter(const TimelineEntry& directory) {
    if (options_.oneFileSystem && directory.device != rootDevice_) {
        GZC_LOG_DEBUG("Not crossing into another filesystem: {}", directory.path);
        ++stats_.crossDeviceSkips;
        return;
    }

    std::error_code ec;
    std::filesystem::directory_iterator children(directory.path, ec);
    if (ec) {
        GZC_LOG_WARNING("Cannot list {}: {}", directory.path, ec.message());
        ++stats_.errors;
        return;
    }
    stack_.push_back(std::move(children));
}

}  // namespace gzc::timeline
