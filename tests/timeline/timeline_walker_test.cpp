// =============================================================================
// gzchunk - Timeline Walker Tests
// =============================================================================

#include "gzc/timeline/timeline_walker.h"

#include <gtest/gtest.h>

#include <sys/stat.h>

#include <algorithm>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "gzc/format/gzchunked.h"
#include "support/test_records.h"

namespace gzc::timeline {
namespace {

using test::TempDir;

void touch(const std::filesystem::path& path, const std::string& content = "") {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

/// @brief root/{a.txt, sub/{b.txt, deeper/c.txt}, link -> sub}
void buildTree(const std::filesystem::path& root) {
    std::filesystem::create_directories(root / "sub" / "deeper");
    touch(root / "a.txt", "alpha");
    touch(root / "sub" / "b.txt", "bravo!");
    touch(root / "sub" / "deeper" / "c.txt");
    std::filesystem::create_directory_symlink(root / "sub", root / "link");
}

std::vector<TimelineEntry> walkAll(TimelineWalker& walker) {
    std::vector<TimelineEntry> entries;
    while (auto entry = walker()) {
        entries.push_back(std::move(*entry));
    }
    return entries;
}

TEST(TimelineWalkerTest, ReportsEveryEntryRootFirst) {
    TempDir dir;
    const auto root = dir / "tree";
    buildTree(root);

    TimelineWalker walker(root);
    const auto entries = walkAll(walker);

    ASSERT_EQ(entries.size(), 7u);
    EXPECT_EQ(entries.front().path, root.string());
    EXPECT_TRUE(entries.front().isDirectory());

    std::set<std::string> paths;
    for (const auto& entry : entries) {
        paths.insert(entry.path);
    }
    const std::set<std::string> expected{
        root.string(),
        (root / "a.txt").string(),
        (root / "sub").string(),
        (root / "sub" / "b.txt").string(),
        (root / "sub" / "deeper").string(),
        (root / "sub" / "deeper" / "c.txt").string(),
        (root / "link").string(),
    };
    EXPECT_EQ(paths, expected);

    EXPECT_EQ(walker.stats().entries, 7u);
    EXPECT_EQ(walker.stats().directories, 3u);
    EXPECT_EQ(walker.stats().errors, 0u);
    EXPECT_FALSE(walker().has_value());
}

TEST(TimelineWalkerTest, ParentsComeBeforeChildren) {
    TempDir dir;
    const auto root = dir / "tree";
    buildTree(root);

    TimelineWalker walker(root);
    const auto entries = walkAll(walker);

    std::map<std::string, std::size_t> position;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        position[entries[i].path] = i;
    }
    for (const auto& entry : entries) {
        if (entry.path == root.string()) {
            continue;
        }
        const auto parent = std::filesystem::path(entry.path).parent_path().string();
        ASSERT_TRUE(position.count(parent)) << entry.path;
        EXPECT_LT(position[parent], position[entry.path]) << entry.path;
    }
}

TEST(TimelineWalkerTest, SymlinksAreReportedNotFollowed) {
    TempDir dir;
    const auto root = dir / "tree";
    buildTree(root);

    TimelineWalker walker(root);
    const auto entries = walkAll(walker);

    const auto link = std::find_if(entries.begin(), entries.end(), [&](const TimelineEntry& e) {
        return e.path == (root / "link").string();
    });
    ASSERT_NE(link, entries.end());
    EXPECT_TRUE(link->isSymlink());
    EXPECT_FALSE(link->isDirectory());

    for (const auto& entry : entries) {
        EXPECT_EQ(entry.path.find((root / "link" / "").string()), std::string::npos) << entry.path;
    }
}

TEST(TimelineWalkerTest, RegularFileFieldsComeFromLstat) {
    TempDir dir;
    const auto file = dir / "single.txt";
    touch(file, "twelve bytes");

    TimelineWalker walker(file);
    const auto entries = walkAll(walker);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].isRegularFile());
    EXPECT_EQ(entries[0].size, 12u);
    EXPECT_NE(entries[0].inode, 0u);
    EXPECT_GT(entries[0].mtimeNanos, 0);
}

TEST(TimelineWalkerTest, MissingRootThrows) {
    TempDir dir;

    try {
        TimelineWalker walker(dir / "does-not-exist");
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFileNotFound);
    }
}

TEST(TimelineWalkerTest, EmptyDirectoryIsJustTheRoot) {
    TempDir dir;
    const auto root = dir / "empty";
    std::filesystem::create_directory(root);

    TimelineWalker walker(root);
    const auto entries = walkAll(walker);

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_TRUE(entries[0].isDirectory());
    EXPECT_EQ(walker.stats().directories, 1u);
}

/// @brief A directory directly under @p parent that lives on another device.
std::optional<std::filesystem::path> findMountBelow(const std::filesystem::path& parent) {
    struct ::stat parentStat {};
    if (::lstat(parent.c_str(), &parentStat) != 0) {
        return std::nullopt;
    }
    std::error_code ec;
    for (const auto& child : std::filesystem::directory_iterator(parent, ec)) {
        struct ::stat childStat {};
        if (::lstat(child.path().c_str(), &childStat) == 0 && S_ISDIR(childStat.st_mode) &&
            childStat.st_dev != parentStat.st_dev) {
            return child.path();
        }
    }
    return std::nullopt;
}

TEST(TimelineWalkerTest, OneFileSystemStopsAtMountPoints) {
    const std::filesystem::path parent = "/dev";
    const auto mount = findMountBelow(parent);
    if (!mount) {
        GTEST_SKIP() << "no mount point directly below " << parent;
    }
    const auto inside = (*mount / "").string();

    TimelineWalker bounded(parent);
    const auto entries = walkAll(bounded);

    EXPECT_GE(bounded.stats().crossDeviceSkips, 1u);
    EXPECT_TRUE(std::any_of(entries.begin(), entries.end(),
                            [&](const TimelineEntry& e) { return e.path == mount->string(); }))
        << "the mount point itself is still reported";
    for (const auto& entry : entries) {
        EXPECT_NE(entry.path.rfind(inside, 0), 0u) << entry.path;
    }

    WalkOptions crossing;
    crossing.oneFileSystem = false;
    TimelineWalker unbounded(parent, crossing);
    (void)walkAll(unbounded);

    EXPECT_EQ(unbounded.stats().crossDeviceSkips, 0u);
}

TEST(TimelineWalkerTest, WalkerFeedsTheCodec) {
    TempDir dir;
    const auto root = dir / "tree";
    buildTree(root);
    for (int i = 0; i < 200; ++i) {
        touch(root / "sub" / ("file-" + std::to_string(i)), std::string(i, 'x'));
    }

    TimelineWalker walker(root);
    std::vector<TimelineEntry> produced;
    auto recording = [&walker, &produced]() {
        auto entry = walker();
        if (entry) {
            produced.push_back(*entry);
        }
        return entry;
    };

    format::EncodeOptions options;
    options.partSize = 1024;
    auto parts = format::encode(recording, options);
    ASSERT_TRUE(parts.has_value()) << parts.error().describe();
    ASSERT_EQ(produced.size(), 207u);

    auto decoded = format::decode<TimelineEntry>(std::span<const Part>(*parts));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
    EXPECT_EQ(*decoded, produced);
}

}  // namespace
}  // namespace gzc::timeline
