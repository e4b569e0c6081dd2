// =============================================================================
// gzchunk - Timeline Entry Tests
// =============================================================================

#include "gzc/timeline/timeline_entry.h"

#include <gtest/gtest.h>
#include <sys/stat.h>

#include <string>
#include <vector>

#include "gzc/format/varint.h"

namespace gzc::timeline {
namespace {

TimelineEntry sampleEntry() {
    TimelineEntry entry;
    entry.path = "/var/log/syslog";
    entry.mode = S_IFREG | 0640;
    entry.size = 123456;
    entry.device = 2049;
    entry.inode = 987654321;
    entry.uid = 0;
    entry.gid = 4;
    entry.atimeNanos = 1700000000123456789LL;
    entry.mtimeNanos = 1700000000000000001LL;
    entry.ctimeNanos = -1500000000LL;
    return entry;
}

std::vector<std::uint8_t> serialized(const TimelineEntry& entry) {
    std::vector<std::uint8_t> out;
    entry.serialize(out);
    return out;
}

TEST(TimelineEntryTest, RoundTrip) {
    const auto entry = sampleEntry();

    auto decoded = TimelineEntry::deserialize(serialized(entry));

    ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
    EXPECT_EQ(*decoded, entry);
}

TEST(TimelineEntryTest, LayoutStartsWithThePath) {
    TimelineEntry entry;
    entry.path = "ab";

    const auto bytes = serialized(entry);

    // Path, six zero uvarints, three zero svarints.
    const std::vector<std::uint8_t> expected{0x02, 'a', 'b', 0, 0, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(bytes, expected);
}

TEST(TimelineEntryTest, TruncationIsADecodeFailure) {
    const auto bytes = serialized(sampleEntry());

    for (std::size_t cut : {std::size_t{0}, std::size_t{1}, std::size_t{5}, bytes.size() - 1}) {
        auto decoded = TimelineEntry::deserialize(std::span<const std::uint8_t>(bytes).first(cut));
        ASSERT_FALSE(decoded.has_value()) << "cut at " << cut;
        EXPECT_EQ(decoded.error().code(), ErrorCode::kRecordDecodeFailed);
        EXPECT_EQ(decoded.error().message().rfind("timeline entry:", 0), 0u);
    }
}

TEST(TimelineEntryTest, TrailingBytesAreRejected) {
    auto bytes = serialized(sampleEntry());
    bytes.push_back(0x00);

    auto decoded = TimelineEntry::deserialize(bytes);

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kRecordDecodeFailed);
}

TEST(TimelineEntryTest, OversizedIdIsRejected) {
    std::vector<std::uint8_t> bytes;
    format::appendUvarint(bytes, 1);
    bytes.push_back('/');
    format::appendUvarint(bytes, S_IFDIR | 0755);
    format::appendUvarint(bytes, 0);
    format::appendUvarint(bytes, 0);
    format::appendUvarint(bytes, 0);
    format::appendUvarint(bytes, 1ULL << 40);  // uid
    format::appendUvarint(bytes, 0);
    for (int i = 0; i < 3; ++i) {
        format::appendSvarint(bytes, 0);
    }

    auto decoded = TimelineEntry::deserialize(bytes);

    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().code(), ErrorCode::kRecordDecodeFailed);
    EXPECT_NE(decoded.error().message().find("uid"), std::string::npos);
}

TEST(TimelineEntryTest, FileTypes) {
    TimelineEntry entry;

    entry.mode = S_IFDIR | 0755;
    EXPECT_TRUE(entry.isDirectory());
    EXPECT_EQ(entry.typeChar(), 'd');

    entry.mode = S_IFREG | 0644;
    EXPECT_TRUE(entry.isRegularFile());
    EXPECT_EQ(entry.typeChar(), '-');

    entry.mode = S_IFLNK | 0777;
    EXPECT_TRUE(entry.isSymlink());
    EXPECT_FALSE(entry.isRegularFile());
    EXPECT_EQ(entry.typeChar(), 'l');

    entry.mode = S_IFIFO | 0600;
    EXPECT_EQ(entry.typeChar(), 'p');

    entry.mode = 0;
    EXPECT_EQ(entry.typeChar(), '?');
}

TEST(TimelineEntryTest, FromStatCopiesFields) {
    struct ::stat st {};
    st.st_mode = S_IFREG | 0600;
    st.st_size = 77;
    st.st_ino = 12;
    st.st_uid = 1000;
    st.st_gid = 100;
    st.st_mtim.tv_sec = 1700000000;
    st.st_mtim.tv_nsec = 5;

    const auto entry = TimelineEntry::fromStat("/tmp/x", st);

    EXPECT_EQ(entry.path, "/tmp/x");
    EXPECT_EQ(entry.size, 77u);
    EXPECT_EQ(entry.inode, 12u);
    EXPECT_EQ(entry.uid, 1000u);
    EXPECT_EQ(entry.gid, 100u);
    EXPECT_EQ(entry.mtimeNanos, 1700000000000000005LL);
    EXPECT_TRUE(entry.isRegularFile());
}

TEST(TimelineEntryTest, TextFormat) {
    TimelineEntry entry;
    entry.path = "/home/user/notes.txt";
    entry.mode = S_IFREG | 0644;
    entry.uid = 1000;
    entry.gid = 100;
    entry.size = 42;
    entry.mtimeNanos = 1700000000123456789LL;

    EXPECT_EQ(formatEntry(entry),
              "-0644   1000    100           42 2023-11-14T22:13:20.123456789Z "
              "/home/user/notes.txt");
}

TEST(TimelineEntryTest, JsonFormat) {
    TimelineEntry entry;
    entry.path = "/tmp/\"quoted\"\n";
    entry.mode = S_IFDIR | 0755;

    const auto json = formatEntryJson(entry);

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
    EXPECT_NE(json.find("\"path\": \"/tmp/\\\"quoted\\\"\\n\""), std::string::npos);
    EXPECT_NE(json.find("\"type\": \"d\""), std::string::npos);
    EXPECT_NE(json.find("\"mode\": 16877"), std::string::npos);
    EXPECT_NE(json.find("\"ctime_ns\": 0"), std::string::npos);
}

TEST(TimelineEntryTest, JsonEscapeControlCharacters) {
    EXPECT_EQ(jsonEscape("plain"), "plain");
    EXPECT_EQ(jsonEscape("a\\b"), "a\\\\b");
    EXPECT_EQ(jsonEscape("tab\there"), "tab\\there");
    EXPECT_EQ(jsonEscape(std::string("\x01", 1)), "\\u0001");
}

}  // namespace
}  // namespace gzc::timeline
