// =============================================================================
// gzchunk - Part File Tests
// =============================================================================

#include "gzc/format/part_files.h"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include "gzc/format/gzchunked.h"
#include "support/test_records.h"

namespace gzc::format {
namespace {

using test::StringRecord;
using test::TempDir;

std::vector<std::uint8_t> bytesOf(const std::string& text) {
    return std::vector<std::uint8_t>(text.begin(), text.end());
}

std::vector<std::uint8_t> readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in),
                                     std::istreambuf_iterator<char>());
}

void writeText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

// =============================================================================
// Naming and Checksums
// =============================================================================

TEST(PartFilesTest, PathsFollowTheBase) {
    const std::filesystem::path base = "/data/out/timeline";

    EXPECT_EQ(partPath(base, 0), std::filesystem::path("/data/out/timeline.0"));
    EXPECT_EQ(partPath(base, 12), std::filesystem::path("/data/out/timeline.12"));
    EXPECT_EQ(manifestPath(base), std::filesystem::path("/data/out/timeline.manifest"));
}

TEST(PartFilesTest, ChecksumIsXxh64) {
    // XXH64 of the empty input with seed 0.
    EXPECT_EQ(partChecksum({}), 0xEF46DB3751D8E999ULL);

    const auto a = bytesOf("part zero");
    const auto b = bytesOf("part one");
    EXPECT_EQ(partChecksum(a), partChecksum(a));
    EXPECT_NE(partChecksum(a), partChecksum(b));
}

TEST(PartFilesTest, FileChecksumMatchesMemoryChecksum) {
    TempDir dir;
    std::vector<std::uint8_t> data(300000);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>(i * 31 + 7);
    }
    const auto path = dir / "blob";
    writeText(path, std::string(data.begin(), data.end()));

    EXPECT_EQ(fileChecksum(path), partChecksum(data));
    EXPECT_THROW((void)fileChecksum(dir / "missing"), IOError);
}

// =============================================================================
// PartWriter
// =============================================================================

TEST(PartWriterTest, WritesPartsAndManifest) {
    TempDir dir;
    const auto base = dir / "timeline";

    PartWriter writer(base);
    const auto first = bytesOf("first part");
    const auto second = bytesOf("second");
    EXPECT_EQ(writer.writePart(first).index, 0u);
    EXPECT_EQ(writer.writePart(second).index, 1u);
    writer.finish();

    EXPECT_TRUE(writer.finished());
    EXPECT_EQ(writer.totalBytes(), first.size() + second.size());
    EXPECT_EQ(readFile(partPath(base, 0)), first);
    EXPECT_EQ(readFile(partPath(base, 1)), second);
    EXPECT_FALSE(std::filesystem::exists(partPath(base, 0).string() + std::string(kTempSuffix)));

    const auto manifest = readManifest(base);
    EXPECT_EQ(manifest, writer.parts());
    ASSERT_EQ(manifest.size(), 2u);
    EXPECT_EQ(manifest[1].size, second.size());
    EXPECT_EQ(manifest[1].checksum, partChecksum(second));
}

TEST(PartWriterTest, EmptyPartSetStillHasManifest) {
    TempDir dir;
    const auto base = dir / "empty";

    PartWriter writer(base);
    writer.finish();

    EXPECT_TRUE(std::filesystem::exists(manifestPath(base)));
    EXPECT_TRUE(readManifest(base).empty());
    EXPECT_TRUE(discoverParts(base).empty());
}

TEST(PartWriterTest, RefusesToOverwriteByDefault) {
    TempDir dir;
    const auto base = dir / "timeline";
    {
        PartWriter writer(base);
        (void)writer.writePart(bytesOf("x"));
        writer.finish();
    }

    try {
        PartWriter again(base);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFileExists);
    }
}

TEST(PartWriterTest, OverwriteRemovesStaleParts) {
    TempDir dir;
    const auto base = dir / "timeline";
    {
        PartWriter writer(base);
        for (int i = 0; i < 4; ++i) {
            (void)writer.writePart(bytesOf("old " + std::to_string(i)));
        }
        writer.finish();
    }

    PartWriter writer(base, true);
    (void)writer.writePart(bytesOf("new"));
    writer.finish();

    EXPECT_EQ(discoverParts(base).size(), 1u);
    EXPECT_FALSE(std::filesystem::exists(partPath(base, 1)));
    EXPECT_EQ(readFile(partPath(base, 0)), bytesOf("new"));
    EXPECT_EQ(readManifest(base).size(), 1u);
}

TEST(PartWriterTest, AbandonedOverwriteLeavesNoManifest) {
    TempDir dir;
    const auto base = dir / "timeline";
    {
        PartWriter writer(base);
        for (int i = 0; i < 3; ++i) {
            (void)writer.writePart(bytesOf("old " + std::to_string(i)));
        }
        writer.finish();
    }

    {
        PartWriter writer(base, true);
        EXPECT_FALSE(std::filesystem::exists(manifestPath(base)));
        (void)writer.writePart(bytesOf("new"));
        // Dropped without finish(), as when encoding fails half way.
    }

    EXPECT_FALSE(std::filesystem::exists(manifestPath(base)));
    try {
        (void)readManifest(base);
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFileNotFound);
    }

    // Only the new part is left; nothing from the old set can be joined to it.
    const auto remaining = discoverParts(base);
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(readFile(remaining[0]), bytesOf("new"));
    EXPECT_FALSE(std::filesystem::exists(partPath(base, 1)));
}

TEST(PartWriterTest, MissingDirectoryIsRejected) {
    TempDir dir;

    try {
        PartWriter writer(dir / "nowhere" / "timeline");
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFileNotFound);
    }
}

TEST(PartWriterTest, EmptyBaseIsUsageError) {
    EXPECT_THROW(PartWriter(std::filesystem::path{}), UsageError);
}

TEST(PartWriterTest, NoWritesAfterFinish) {
    TempDir dir;
    PartWriter writer(dir / "timeline");
    writer.finish();

    EXPECT_THROW((void)writer.writePart(bytesOf("late")), CodecError);
    EXPECT_THROW(writer.finish(), CodecError);
}

// =============================================================================
// Manifest Parsing
// =============================================================================

TEST(ManifestTest, MissingManifestIsFileNotFound) {
    TempDir dir;

    try {
        (void)readManifest(dir / "absent");
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFileNotFound);
    }
}

TEST(ManifestTest, MalformedManifestsAreFormatErrors) {
    TempDir dir;
    const auto base = dir / "bad";
    const std::string header = std::string(kManifestHeader) + "\n";

    const std::vector<std::string> manifests{
        "not a manifest\n",
        header + "0 10\n",
        header + "0 10 zz bad.0\n",
        header + "1 10 00000000000000ff bad.1\n",
        header + "0 10 00000000000000ff ../escape.0\n",
    };

    for (const auto& text : manifests) {
        writeText(manifestPath(base), text);
        EXPECT_THROW((void)readManifest(base), FormatError) << text;
    }
}

TEST(ManifestTest, BlankLinesAreIgnored) {
    TempDir dir;
    const auto base = dir / "ok";
    writeText(manifestPath(base), std::string(kManifestHeader) +
                                      "\n0 3 00000000000000aa ok.0\n\n1 4 00000000000000bb ok.1\n");

    const auto parts = readManifest(base);

    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0].path, dir / "ok.0");
    EXPECT_EQ(parts[1].checksum, 0xbbu);
    EXPECT_EQ(parts[1].size, 4u);
}

// =============================================================================
// Discovery and Decoding From Disk
// =============================================================================

TEST(PartFilesTest, DiscoveryStopsAtFirstGap) {
    TempDir dir;
    const auto base = dir / "parts";
    writeText(partPath(base, 0), "a");
    writeText(partPath(base, 1), "b");
    writeText(partPath(base, 3), "d");

    const auto paths = discoverParts(base);

    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[1], partPath(base, 1));
}

TEST(PartFilesTest, OpenPartsReportsMissingFile) {
    TempDir dir;

    try {
        (void)openParts({dir / "missing.0"});
        FAIL() << "expected IOError";
    } catch (const IOError& e) {
        EXPECT_EQ(e.code(), ErrorCode::kFileOpenFailed);
    }
}

TEST(PartFilesTest, EncodedPartsDecodeFromDisk) {
    TempDir dir;
    const auto base = dir / "records";
    const auto records = test::numberedRecords(20000);

    EncodeOptions options;
    options.partSize = 4096;
    options.compression = io::Compression::none();
    GzChunkedEncoder encoder(fromRange(records), options);

    PartWriter writer(base);
    for (;;) {
        auto part = encoder.nextPart();
        ASSERT_TRUE(part.has_value()) << part.error().describe();
        if (!part->has_value()) {
            break;
        }
        (void)writer.writePart(**part);
    }
    writer.finish();
    ASSERT_GT(writer.parts().size(), 1u);

    std::vector<std::filesystem::path> paths;
    for (const auto& info : readManifest(base)) {
        EXPECT_EQ(fileChecksum(info.path), info.checksum);
        paths.push_back(info.path);
    }

    auto decoded = decode<StringRecord>(openParts(paths));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().describe();
    EXPECT_EQ(*decoded, records);
}

}  // namespace
}  // namespace gzc::format
