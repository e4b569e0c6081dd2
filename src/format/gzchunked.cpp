// =============================================================================
// gzchunk - Chunked Gzip Transfer Codec Implementation
// =============================================================================

#include "gzc/format/gzchunked.h"

#include <fmt/format.h>

#include "gzc/io/memory_stream.h"

namespace gzc::format {

VoidResult EncodeOptions::validate() const {
    if (partSize == 0) {
        return makeVoidError(ErrorCode::kUsageError, "part size must be positive");
    }
    if (copyChunkSize == 0) {
        return makeVoidError(ErrorCode::kUsageError, "copy chunk size must be positive");
    }
    return makeVoidSuccess();
}

std::vector<std::unique_ptr<std::streambuf>> inflateParts(
    std::vector<std::unique_ptr<std::streambuf>> parts) {
    std::vector<std::unique_ptr<std::streambuf>> inflated;
    inflated.reserve(parts.size());

    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!parts[i]) {
            throw UsageError(fmt::format("part source {} is null", i));
        }
        ErrorContext context;
        context.withPart(static_cast<PartIndex>(i));
        inflated.push_back(std::make_unique<io::GzipStreamBuf>(std::move(parts[i]), context));
    }
    return inflated;
}

std::vector<std::unique_ptr<std::streambuf>> memoryPartSources(std::span<const Part> parts) {
    std::vector<std::unique_ptr<std::streambuf>> sources;
    sources.reserve(parts.size());
    for (const auto& part : parts) {
        sources.push_back(std::make_unique<io::MemoryStreamBuf>(std::span<const std::uint8_t>(part)));
    }
    return sources;
}

}  // namespace gzc::format
