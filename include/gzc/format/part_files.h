// =============================================================================
// gzchunk - Part Persistence
// =============================================================================
// Stores encoded parts as numbered files next to a base path and describes
// them in a text manifest.
//
// Layout for base "/var/lib/agent/timeline":
//
//   /var/lib/agent/timeline.0
//   /var/lib/agent/timeline.1
//   ...
//   /var/lib/agent/timeline.manifest
//
// Manifest format:
//
//   gzchunked-manifest 1
//   <index> <size> <xxh64 as 16 hex digits> <file name>
//   ...
//
// Every file is written to "<target>.tmp" and renamed into place, so a
// crashed writer never leaves a truncated part under its final name.
// =============================================================================

#ifndef GZC_FORMAT_PART_FILES_H
#define GZC_FORMAT_PART_FILES_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <streambuf>
#include <string_view>
#include <vector>

#include "gzc/common/error.h"
#include "gzc/common/types.h"

namespace gzc::format {

inline constexpr std::string_view kManifestHeader = "gzchunked-manifest 1";

inline constexpr std::string_view kManifestSuffix = ".manifest";

inline constexpr std::string_view kTempSuffix = ".tmp";

/// @brief One part as recorded in the manifest.
struct PartInfo {
    PartIndex index = 0;
    std::filesystem::path path;
    std::uint64_t size = 0;
    Checksum checksum = 0;

    bool operator==(const PartInfo&) const = default;
};

// =============================================================================
// Naming and Checksums
// =============================================================================

/// @brief "<base>.<index>".
[[nodiscard]] std::filesystem::path partPath(const std::filesystem::path& base, PartIndex index);

/// @brief "<base>.manifest".
[[nodiscard]] std::filesystem::path manifestPath(const std::filesystem::path& base);

/// @brief xxHash64 (seed 0) of a part held in memory.
[[nodiscard]] Checksum partChecksum(std::span<const std::uint8_t> data) noexcept;

/// @brief xxHash64 (seed 0) of a file's contents.
/// @throws IOError if the file cannot be read.
[[nodiscard]] Checksum fileChecksum(const std::filesystem::path& path);

// =============================================================================
// PartWriter
// =============================================================================

/// @brief Writes parts and their manifest next to a base path.
class PartWriter {
public:
    /// @param base Base path; its parent directory must exist.
    /// @param overwrite Replace an existing part set instead of failing. The
    ///        old manifest and parts are removed here, before anything new
    ///        is written, so an abandoned writer leaves no manifest behind.
    /// @throws IOError(kFileExists) if a part set exists and overwrite is off,
    ///         IOError(kFileNotFound) if the parent directory is missing.
    explicit PartWriter(std::filesystem::path base, bool overwrite = false);

    PartWriter(const PartWriter&) = delete;
    PartWriter& operator=(const PartWriter&) = delete;

    /// @brief Write the next part atomically.
    /// @throws IOError on write or rename failure, CodecError(kInvalidState)
    ///         after finish().
    const PartInfo& writePart(std::span<const std::uint8_t> part);

    /// @brief Write the manifest. Until this runs the part set has none.
    void finish();

    [[nodiscard]] const std::vector<PartInfo>& parts() const noexcept { return parts_; }

    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return totalBytes_; }

    [[nodiscard]] const std::filesystem::path& base() const noexcept { return base_; }

    [[nodiscard]] bool finished() const noexcept { return finished_; }

private:
    std::filesystem::path base_;
    std::vector<PartInfo> parts_;
    std::uint64_t totalBytes_ = 0;
    bool overwrite_;
    bool finished_ = false;
};

// =============================================================================
// Reading
// =============================================================================

/// @brief Parse "<base>.manifest".
/// @throws IOError(kFileNotFound) if absent, FormatError on a bad header,
///         a malformed line or non-consecutive indices.
[[nodiscard]] std::vector<PartInfo> readManifest(const std::filesystem::path& base);

/// @brief List "<base>.0", "<base>.1", ... up to the first missing index.
[[nodiscard]] std::vector<std::filesystem::path> discoverParts(const std::filesystem::path& base);

/// @brief Open each path as a binary input file buffer.
/// @throws IOError(kFileOpenFailed) naming the first file that cannot be
///         opened.
[[nodiscard]] std::vector<std::unique_ptr<std::streambuf>> openParts(
    const std::vector<std::filesystem::path>& paths);

}  // namespace gzc::format

#endif  // GZC_FORMAT_PART_FILES_H
