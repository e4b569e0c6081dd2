// =============================================================================
// gzchunk - Filesystem Timeline Entry Implementation
// =============================================================================

#include "gzc/timeline/timeline_entry.h"

#include <sys/stat.h>

#include <ctime>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include "gzc/format/varint.h"

namespace gzc::timeline {

namespace {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000;

std::int64_t toNanos(const struct timespec& ts) noexcept {
    return static_cast<std::int64_t>(ts.tv_sec) * kNanosPerSecond +
           static_cast<std::int64_t>(ts.tv_nsec);
}

Result<std::uint32_t> narrow32(Result<std::uint64_t> value, std::string_view field) {
    if (!value) {
        return std::unexpected(value.error());
    }
    if (*value > std::numeric_limits<std::uint32_t>::max()) {
        return makeError<std::uint32_t>(ErrorCode::kRecordDecodeFailed,
                                         fmt::format("{} {} does not fit 32 bits", field, *value));
    }
    return static_cast<std::uint32_t>(*value);
}

std::string formatTimestamp(std::int64_t nanos) {
    std::int64_t seconds = nanos / kNanosPerSecond;
    std::int64_t fraction = nanos % kNanosPerSecond;
    if (fraction < 0) {
        fraction += kNanosPerSecond;
        --seconds;
    }

    const auto time = static_cast<std::time_t>(seconds);
    std::tm tm{};
    if (gmtime_r(&time, &tm) == nullptr) {
        return fmt::format("@{}", nanos);
    }
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:09}Z", tm.tm_year + 1900,
                       tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, fraction);
}

}  // namespace

// =============================================================================
// TimelineEntry Implementation
// =============================================================================

TimelineEntry TimelineEntry::fromStat(std::string path, const struct ::stat& st) {
    TimelineEntry entry;
    entry.path = std::move(path);
    entry.mode = static_cast<std::uint32_t>(st.st_mode);
    entry.size = static_cast<std::uint64_t>(st.st_size);
    entry.device = static_cast<std::uint64_t>(st.st_dev);
    entry.inode = static_cast<std::uint64_t>(st.st_ino);
    entry.uid = static_cast<std::uint32_t>(st.st_uid);
    entry.gid = static_cast<std::uint32_t>(st.st_gid);
    entry.atimeNanos = toNanos(st.st_atim);
    entry.mtimeNanos = toNanos(st.st_mtim);
    entry.ctimeNanos = toNanos(st.st_ctim);
    return entry;
}

void TimelineEntry::serialize(std::vector<std::uint8_t>& out) const {
    format::appendUvarint(out, path.size());
    out.insert(out.end(), path.begin(), path.end());

    format::appendUvarint(out, mode);
    format::appendUvarint(out, size);
    format::appendUvarint(out, device);
    format::appendUvarint(out, inode);
    format::appendUvarint(out, uid);
    format::appendUvarint(out, gid);

    format::appendSvarint(out, atimeNanos);
    format::appendSvarint(out, mtimeNanos);
    format::appendSvarint(out, ctimeNanos);
}

Result<TimelineEntry> TimelineEntry::deserialize(std::span<const std::uint8_t> bytes) {
    format::ByteCursor cursor(bytes);
    TimelineEntry entry;

    auto fail = [](const Error& error) {
        return makeError<TimelineEntry>(ErrorCode::kRecordDecodeFailed,
                                        "timeline entry: " + error.message());
    };

    auto pathLength = cursor.readUvarint();
    if (!pathLength) {
        return fail(pathLength.error());
    }
    if (*pathLength > cursor.remaining()) {
        return makeError<TimelineEntry>(
            ErrorCode::kRecordDecodeFailed,
            fmt::format("timeline entry: path length {} exceeds the {} remaining bytes",
                        *pathLength, cursor.remaining()));
    }
    auto pathBytes = cursor.readBytes(static_cast<std::size_t>(*pathLength));
    if (!pathBytes) {
        return fail(pathBytes.error());
    }
    entry.path.assign(pathBytes->begin(), pathBytes->end());

    auto mode = narrow32(cursor.readUvarint(), "mode");
    if (!mode) {
        return fail(mode.error());
    }
    entry.mode = *mode;

    for (std::uint64_t* field : {&entry.size, &entry.device, &entry.inode}) {
        auto value = cursor.readUvarint();
        if (!value) {
            return fail(value.error());
        }
        *field = *value;
    }

    auto uid = narrow32(cursor.readUvarint(), "uid");
    if (!uid) {
        return fail(uid.error());
    }
    entry.uid = *uid;

    auto gid = narrow32(cursor.readUvarint(), "gid");
    if (!gid) {
        return fail(gid.error());
    }
    entry.gid = *gid;

    for (std::int64_t* field : {&entry.atimeNanos, &entry.mtimeNanos, &entry.ctimeNanos}) {
        auto value = cursor.readSvarint();
        if (!value) {
            return fail(value.error());
        }
        *field = *value;
    }

    if (!cursor.atEnd()) {
        return makeError<TimelineEntry>(
            ErrorCode::kRecordDecodeFailed,
            fmt::format("timeline entry: {} trailing bytes", cursor.remaining()));
    }

    return entry;
}

bool TimelineEntry::isDirectory() const noexcept { return S_ISDIR(mode); }

bool TimelineEntry::isRegularFile() const noexcept { return S_ISREG(mode); }

bool TimelineEntry::isSymlink() const noexcept { return S_ISLNK(mode); }

char TimelineEntry::typeChar() const noexcept {
    if (S_ISDIR(mode)) {
        return 'd';
    }
    if (S_ISREG(mode)) {
        return '-';
    }
    if (S_ISLNK(mode)) {
        return 'l';
    }
    if (S_ISCHR(mode)) {
        return 'c';
    }
    if (S_ISBLK(mode)) {
        return 'b';
    }
    if (S_ISFIFO(mode)) {
        return 'p';
    }
    if (S_ISSOCK(mode)) {
        return 's';
    }
    return '?';
}

// =============================================================================
// Formatting
// =============================================================================

std::string formatEntry(const TimelineEntry& entry) {
    return fmt::format("{}{:04o} {:>6} {:>6} {:>12} {} {}", entry.typeChar(), entry.mode & 07777,
                       entry.uid, entry.gid, entry.size, formatTimestamp(entry.mtimeNanos),
                       entry.path);
}

std::string formatEntryJson(const TimelineEntry& entry) {
    return fmt::format(
        "{{\"path\": \"{}\", \"type\": \"{}\", \"mode\": {}, \"size\": {}, \"device\": {}, "
        "\"inode\": {}, \"uid\": {}, \"gid\": {}, \"atime_ns\": {}, \"mtime_ns\": {}, "
        "\"ctime_ns\": {}}}",
        jsonEscape(entry.path), entry.typeChar(), entry.mode, entry.size, entry.device,
        entry.inode, entry.uid, entry.gid, entry.atimeNanos, entry.mtimeNanos, entry.ctimeNanos);
}

std::string jsonEscape(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

}  // namespace gzc::timeline
