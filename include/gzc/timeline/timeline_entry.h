// =============================================================================
// gzchunk - Filesystem Timeline Entry
// =============================================================================
// One lstat(2) snapshot of a filesystem entry, the record type shipped by the
// timeline collection.
//
// Wire layout (all integers are varints):
//
//   uvarint path length | path bytes
//   uvarint mode | size | device | inode | uid | gid
//   zigzag  atime | mtime | ctime            (nanoseconds since the epoch)
// =============================================================================

#ifndef GZC_TIMELINE_TIMELINE_ENTRY_H
#define GZC_TIMELINE_TIMELINE_ENTRY_H

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gzc/common/error.h"

struct stat;

namespace gzc::timeline {

struct TimelineEntry {
    std::string path;
    std::uint32_t mode = 0;
    std::uint64_t size = 0;
    std::uint64_t device = 0;
    std::uint64_t inode = 0;
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    std::int64_t atimeNanos = 0;
    std::int64_t mtimeNanos = 0;
    std::int64_t ctimeNanos = 0;

    /// @brief Build an entry from the result of lstat(path).
    [[nodiscard]] static TimelineEntry fromStat(std::string path, const struct ::stat& st);

    void serialize(std::vector<std::uint8_t>& out) const;

    /// @return kRecordDecodeFailed on truncated input, out-of-range fields
    ///         or trailing bytes.
    [[nodiscard]] static Result<TimelineEntry> deserialize(std::span<const std::uint8_t> bytes);

    [[nodiscard]] bool isDirectory() const noexcept;
    [[nodiscard]] bool isRegularFile() const noexcept;
    [[nodiscard]] bool isSymlink() const noexcept;

    /// @brief ls-style type character: 'd', '-', 'l', 'c', 'b', 'p', 's' or '?'.
    [[nodiscard]] char typeChar() const noexcept;

    bool operator==(const TimelineEntry&) const = default;
};

/// @brief One-line text rendering: type, octal permissions, ids, size,
///        mtime (UTC, ISO 8601 with nanoseconds) and path.
[[nodiscard]] std::string formatEntry(const TimelineEntry& entry);

/// @brief Single-line JSON object with every field.
[[nodiscard]] std::string formatEntryJson(const TimelineEntry& entry);

/// @brief Escape a string for inclusion in a JSON string literal.
[[nodiscard]] std::string jsonEscape(std::string_view text);

}  // namespace gzc::timeline

#endif  // GZC_TIMELINE_TIMELINE_ENTRY_H
