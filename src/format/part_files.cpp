// =============================================================================
// gzchunk - Part Persistence Implementation
// =============================================================================

#include "gzc/format/part_files.h"

#include <charconv>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <xxhash.h>

#include "gzc/common/logger.h"

namespace gzc::format {

namespace {

struct XxhStateDeleter {
    void operator()(XXH64_state_t* state) const noexcept { XXH64_freeState(state); }
};

using XxhState = std::unique_ptr<XXH64_state_t, XxhStateDeleter>;

std::filesystem::path withSuffix(const std::filesystem::path& path, std::string_view suffix) {
    std::filesystem::path result = path;
    result += std::string(suffix);
    return result;
}

void removeQuietly(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        GZC_LOG_WARNING("Failed to remove temporary file: {}", path.string());
    }
}

/// @brief Write data to "<target>.tmp" and rename it over target.
void writeFileAtomically(const std::filesystem::path& target, std::span<const std::uint8_t> data) {
    const auto tempPath = withSuffix(target, kTempSuffix);

    std::ofstream stream(tempPath, std::ios::binary | std::ios::trunc);
    if (!stream.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed,
                      "Failed to create temporary file: " + tempPath.string(),
                      ErrorContext(tempPath.string()));
    }

    stream.write(reinterpret_cast<const char*>(data.data()),
                 static_cast<std::streamsize>(data.size()));
    stream.flush();
    if (!stream.good()) {
        stream.close();
        removeQuietly(tempPath);
        throw IOError("Failed to write file", ErrorContext(tempPath.string()));
    }
    stream.close();

    std::error_code ec;
    std::filesystem::rename(tempPath, target, ec);
    if (ec) {
        removeQuietly(tempPath);
        throw IOError("Failed to rename temporary file into place", ec,
                      ErrorContext(target.string()));
    }
}

/// @brief Remove path if present; false if there was nothing to remove.
bool removeExisting(const std::filesystem::path& path) {
    std::error_code ec;
    const bool removed = std::filesystem::remove(path, ec);
    if (ec) {
        throw IOError("Failed to remove previous output", ec, ErrorContext(path.string()));
    }
    return removed;
}

[[noreturn]] void throwManifestError(const std::filesystem::path& manifest, std::size_t lineNo,
                                     std::string_view what) {
    throw FormatError(fmt::format("manifest line {}: {}", lineNo, what),
                      ErrorContext(manifest.string()));
}

}  // namespace

// =============================================================================
// Naming and Checksums
// =============================================================================

std::filesystem::path partPath(const std::filesystem::path& base, PartIndex index) {
    return withSuffix(base, fmt::format(".{}", index));
}

std::filesystem::path manifestPath(const std::filesystem::path& base) {
    return withSuffix(base, kManifestSuffix);
}

Checksum partChecksum(std::span<const std::uint8_t> data) noexcept {
    return XXH64(data.data(), data.size(), 0);
}

Checksum fileChecksum(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open()) {
        throw IOError(ErrorCode::kFileOpenFailed, "Failed to open file: " + path.string(),
                      ErrorContext(path.string()));
    }

    XxhState state(XXH64_createState());
    if (!state) {
        throw IOError("Failed to create xxHash64 state");
    }
    XXH64_reset(state.get(), 0);

    std::vector<char> buffer(kDefaultStreamBufferSize);
    while (stream) {
        stream.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto n = stream.gcount();
        if (n > 0) {
            XXH64_update(state.get(), buffer.data(), static_cast<std::size_t>(n));
        }
    }
    if (stream.bad()) {
        throw IOError("Failed to read file", ErrorContext(path.string()));
    }

    return XXH64_digest(state.get());
}

// =============================================================================
// PartWriter Implementation
// =============================================================================

PartWriter::PartWriter(std::filesystem::path base, bool overwrite)
    : base_(std::move(base)), overwrite_(overwrite) {
    if (base_.empty() || !base_.has_filename()) {
        throw UsageError("output base path must name a file: '" + base_.string() + "'");
    }

    std::error_code ec;
    const auto parent = base_.has_parent_path() ? base_.parent_path() : std::filesystem::path(".");
    if (!std::filesystem::is_directory(parent, ec)) {
        throw IOError(ErrorCode::kFileNotFound, "Output directory does not exist: " + parent.string(),
                      ErrorContext(parent.string()));
    }

    if (overwrite_) {
        // The manifest goes first: without it a half-replaced set is never
        // taken for a complete one.
        if (removeExisting(manifestPath(base_))) {
            GZC_LOG_DEBUG("Removed previous manifest: {}", manifestPath(base_).string());
        }
        PartIndex removed = 0;
        while (removeExisting(partPath(base_, removed))) {
            ++removed;
        }
        if (removed > 0) {
            GZC_LOG_DEBUG("Removed {} previous parts of {}", removed, base_.string());
        }
    } else {
        for (const auto& existing : {manifestPath(base_), partPath(base_, 0)}) {
            if (std::filesystem::exists(existing, ec)) {
                throw IOError(ErrorCode::kFileExists,
                              "Output already exists (use --force to overwrite): " +
                                  existing.string(),
                              ErrorContext(existing.string()));
            }
        }
    }

    GZC_LOG_DEBUG("PartWriter created: base={}, overwrite={}", base_.string(), overwrite_);
}

const PartInfo& PartWriter::writePart(std::span<const std::uint8_t> part) {
    if (finished_) {
        throw CodecError(ErrorCode::kInvalidState, "part writer already finished");
    }

    PartInfo info;
    info.index = static_cast<PartIndex>(parts_.size());
    info.path = partPath(base_, info.index);
    info.size = part.size();
    info.checksum = partChecksum(part);

    writeFileAtomically(info.path, part);

    totalBytes_ += info.size;
    parts_.push_back(std::move(info));

    const auto& written = parts_.back();
    GZC_LOG_DEBUG("Part written: {} ({} bytes, xxh64={:016x})", written.path.string(),
                  written.size, written.checksum);
    return written;
}

void PartWriter::finish() {
    if (finished_) {
        throw CodecError(ErrorCode::kInvalidState, "part writer already finished");
    }

    std::string manifest(kManifestHeader);
    manifest += '\n';
    for (const auto& info : parts_) {
        manifest += fmt::format("{} {} {:016x} {}\n", info.index, info.size, info.checksum,
                                info.path.filename().string());
    }

    writeFileAtomically(manifestPath(base_),
                        std::span<const std::uint8_t>(
                            reinterpret_cast<const std::uint8_t*>(manifest.data()),
                            manifest.size()));

    finished_ = true;
    GZC_LOG_INFO("Part set finalized: {}, parts={}, bytes={}", base_.string(), parts_.size(),
                 totalBytes_);
}

// =============================================================================
// Reading
// =============================================================================

std::vector<PartInfo> readManifest(const std::filesystem::path& base) {
    const auto manifest = manifestPath(base);

    std::ifstream stream(manifest);
    if (!stream.is_open()) {
        throw IOError(ErrorCode::kFileNotFound, "Manifest not found: " + manifest.string(),
                      ErrorContext(manifest.string()));
    }

    std::string line;
    if (!std::getline(stream, line) || line != kManifestHeader) {
        throwManifestError(manifest, 1, "missing or unsupported header");
    }

    const auto directory = base.parent_path();
    std::vector<PartInfo> parts;
    std::size_t lineNo = 1;

    while (std::getline(stream, line)) {
        ++lineNo;
        if (line.empty()) {
            continue;
        }

        std::istringstream fields(line);
        std::uint64_t index = 0;
        std::uint64_t size = 0;
        std::string checksumText;
        std::string name;
        if (!(fields >> index >> size >> checksumText) || !std::getline(fields >> std::ws, name) ||
            name.empty()) {
            throwManifestError(manifest, lineNo, "expected '<index> <size> <checksum> <file>'");
        }

        Checksum checksum = 0;
        const auto* first = checksumText.data();
        const auto* last = first + checksumText.size();
        auto [ptr, ec] = std::from_chars(first, last, checksum, 16);
        if (ec != std::errc{} || ptr != last) {
            throwManifestError(manifest, lineNo, "invalid checksum '" + checksumText + "'");
        }

        if (index != parts.size()) {
            throwManifestError(manifest, lineNo,
                               fmt::format("expected part {}, found {}", parts.size(), index));
        }

        if (std::filesystem::path(name).has_parent_path()) {
            throwManifestError(manifest, lineNo, "part name must be a plain file name");
        }

        PartInfo info;
        info.index = static_cast<PartIndex>(index);
        info.path = directory / name;
        info.size = size;
        info.checksum = checksum;
        parts.push_back(std::move(info));
    }

    if (stream.bad()) {
        throw IOError("Failed to read manifest", ErrorContext(manifest.string()));
    }

    return parts;
}

std::vector<std::filesystem::path> discoverParts(const std::filesystem::path& base) {
    std::vector<std::filesystem::path> paths;
    std::error_code ec;
    for (PartIndex index = 0;; ++index) {
        auto path = partPath(base, index);
        if (!std::filesystem::is_regular_file(path, ec)) {
            break;
        }
        paths.push_back(std::move(path));
    }
    return paths;
}

std::vector<std::unique_ptr<std::streambuf>> openParts(
    const std::vector<std::filesystem::path>& paths) {
    std::vector<std::unique_ptr<std::streambuf>> sources;
    sources.reserve(paths.size());

    for (const auto& path : paths) {
        auto file = std::make_unique<std::filebuf>();
        if (file->open(path, std::ios::in | std::ios::binary) == nullptr) {
            throw IOError(ErrorCode::kFileOpenFailed, "Failed to open part: " + path.string(),
                          ErrorContext(path.string()));
        }
        sources.push_back(std::move(file));
    }
    return sources;
}

}  // namespace gzc::format
