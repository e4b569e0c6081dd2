// =============================================================================
// gzchunk - Chunked Gzip Transfer Codec
// =============================================================================
// Streams an arbitrarily long sequence of records into an ordered list of
// independently gzip-compressed parts whose compressed size is bounded by a
// soft ceiling, and reassembles the records from those parts.
//
// Encoding:
//
//   records --ChunkedStreamBuf--> framed stream --copyUntil--> GzipEncoder
//                                                               |
//                             sealed once compressedSize() >= partSize
//
// Decoding:
//
//   part 0 --GzipStreamBuf--\
//   part 1 --GzipStreamBuf----> JoinedStreamBuf --> ChunkedDecoder --> records
//   part N --GzipStreamBuf--/
//
// Frames may straddle part boundaries, so parts are only meaningful as a
// complete, ordered sequence.
//
// Usage:
//   gzc::format::GzChunkedEncoder encoder(gzc::fromRange(entries));
//   for (;;) {
//       auto part = encoder.nextPart();
//       if (!part) {
//           part.error().throwException();   // or report part.error()
//       }
//       if (!part->has_value()) {
//           break;                           // producer exhausted
//       }
//       send(**part);
//   }
// =============================================================================

#ifndef GZC_FORMAT_GZCHUNKED_H
#define GZC_FORMAT_GZCHUNKED_H

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <streambuf>
#include <utility>
#include <vector>

#include "gzc/common/error.h"
#include "gzc/common/logger.h"
#include "gzc/common/types.h"
#include "gzc/format/chunked.h"
#include "gzc/io/compressed_stream.h"
#include "gzc/io/copy.h"
#include "gzc/io/joined_stream.h"

namespace gzc::format {

// =============================================================================
// Encode Options
// =============================================================================

struct EncodeOptions {
    /// @brief gzip level of every part.
    io::Compression compression{};

    /// @brief Soft ceiling on the compressed size of a part.
    std::uint64_t partSize = kDefaultPartSize;

    /// @brief Bytes moved from the framed stream per copy step.
    /// @note The overshoot past partSize is dominated by zlib's buffering, not
    ///       by this step: deflate holds back up to one block (about 16 K
    ///       symbols) before emitting it. 40-byte records with partSize 64 KiB
    ///       and 1 KiB steps gave parts of up to 65569 bytes at level 0 and
    ///       78257 bytes at level 5, roughly 12 steps over.
    std::size_t copyChunkSize = kDefaultCopyChunkSize;

    /// @return kUsageError if partSize or copyChunkSize is zero.
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Part Source Helpers
// =============================================================================

/// @brief Wrap each compressed part source in a GzipStreamBuf tagged with its
///        part index.
[[nodiscard]] std::vector<std::unique_ptr<std::streambuf>> inflateParts(
    std::vector<std::unique_ptr<std::streambuf>> parts);

/// @brief Non-owning sources over in-memory parts.
/// @note The parts must outlive the returned sources.
[[nodiscard]] std::vector<std::unique_ptr<std::streambuf>> memoryPartSources(
    std::span<const Part> parts);

// =============================================================================
// GzChunkedEncoder
// =============================================================================

/// @brief Pull-based partitioning encoder.
///
/// Each nextPart() seals at most one part. Every part except the last one is
/// at least partSize bytes long; a part may exceed partSize by one copy step
/// plus the data zlib was still holding when the part was sealed.
template <RecordProducer P>
class GzChunkedEncoder {
public:
    /// @throws UsageError if the options do not validate.
    explicit GzChunkedEncoder(P producer, EncodeOptions options = {})
        : framed_(std::make_unique<ChunkedStreamBuf<P>>(std::move(producer))),
          options_(options) {
        unwrapOrThrow(options_.validate());
    }

    /// @brief Produce the next part.
    /// @return The part, std::nullopt once the records are exhausted, or the
    ///         error that stopped encoding. After an error every further pull
    ///         fails with kInvalidState; parts already returned stay valid.
    [[nodiscard]] Result<std::optional<Part>> nextPart() {
        if (failed_) {
            return makeError<std::optional<Part>>(ErrorCode::kInvalidState,
                                                  "encoding already failed");
        }
        if (done_) {
            return std::optional<Part>{};
        }

        auto result = tryExecute([this]() { return sealNextPart(); });
        if (!result) {
            failed_ = true;
            GZC_LOG_ERROR("Encoding failed after {} parts: {}", partsProduced_,
                          result.error().describe());
            return result;
        }
        if (!result->has_value()) {
            done_ = true;
            GZC_LOG_DEBUG("Encoded {} records into {} parts ({} -> {} bytes)",
                          framed_->recordsEncoded(), partsProduced_, bytesFramed_,
                          compressedBytes_);
        }
        return result;
    }

    [[nodiscard]] const EncodeOptions& options() const noexcept { return options_; }

    [[nodiscard]] PartIndex partsProduced() const noexcept { return partsProduced_; }

    [[nodiscard]] RecordIndex recordsEncoded() const noexcept { return framed_->recordsEncoded(); }

    /// @brief Framed bytes sealed into parts so far.
    [[nodiscard]] std::uint64_t bytesFramed() const noexcept { return bytesFramed_; }

    [[nodiscard]] std::uint64_t compressedBytes() const noexcept { return compressedBytes_; }

private:
    std::optional<Part> sealNextPart() {
        io::GzipEncoder encoder(options_.compression);

        const std::uint64_t partSize = options_.partSize;
        const std::uint64_t copied = io::copyUntil(
            *framed_, encoder,
            [partSize](const io::GzipEncoder& e) { return e.compressedSize() >= partSize; },
            options_.copyChunkSize);

        if (copied == 0) {
            return std::nullopt;
        }

        Part part = encoder.finish();
        GZC_LOG_DEBUG("Sealed part {}: {} framed bytes -> {} bytes", partsProduced_, copied,
                      part.size());

        ++partsProduced_;
        bytesFramed_ += copied;
        compressedBytes_ += part.size();
        return part;
    }

    std::unique_ptr<ChunkedStreamBuf<P>> framed_;
    EncodeOptions options_;
    PartIndex partsProduced_ = 0;
    std::uint64_t bytesFramed_ = 0;
    std::uint64_t compressedBytes_ = 0;
    bool done_ = false;
    bool failed_ = false;
};

// =============================================================================
// GzChunkedDecoder
// =============================================================================

/// @brief Pull-based decoder over an ordered sequence of compressed parts.
template <SerializableRecord R>
class GzChunkedDecoder {
public:
    /// @param parts Compressed part sources in production order.
    explicit GzChunkedDecoder(std::vector<std::unique_ptr<std::streambuf>> parts)
        : partCount_(parts.size()),
          joined_(std::make_unique<io::JoinedStreamBuf>(inflateParts(std::move(parts)))),
          decoder_(*joined_) {}

    /// @brief Decode in-memory parts; the parts must outlive the decoder.
    explicit GzChunkedDecoder(std::span<const Part> parts)
        : GzChunkedDecoder(memoryPartSources(parts)) {}

    /// @brief Produce the next record.
    /// @return The record, std::nullopt at the end of the last part, or the
    ///         error that stopped decoding.
    [[nodiscard]] Result<std::optional<R>> next() {
        auto result = decoder_.next();
        if (!result && result.error().code() != ErrorCode::kInvalidState) {
            GZC_LOG_ERROR("Decoding failed in part {} of {}: {}", joined_->currentIndex(),
                          partCount_, result.error().describe());
        }
        return result;
    }

    [[nodiscard]] std::size_t partCount() const noexcept { return partCount_; }

    [[nodiscard]] RecordIndex recordsDecoded() const noexcept { return decoder_.recordsDecoded(); }

    /// @brief Decompressed (framed) bytes consumed so far.
    [[nodiscard]] std::uint64_t bytesConsumed() const noexcept { return decoder_.bytesConsumed(); }

private:
    std::size_t partCount_;
    std::unique_ptr<io::JoinedStreamBuf> joined_;
    ChunkedDecoder<R> decoder_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/// @brief Encode every record of a producer into parts.
template <RecordProducer P>
[[nodiscard]] Result<std::vector<Part>> encode(P producer, EncodeOptions options = {}) {
    if (auto valid = options.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    GzChunkedEncoder<P> encoder(std::move(producer), options);
    std::vector<Part> parts;
    for (;;) {
        auto part = encoder.nextPart();
        if (!part) {
            return std::unexpected(part.error());
        }
        if (!part->has_value()) {
            return parts;
        }
        parts.push_back(std::move(**part));
    }
}

/// @brief Decode every record from ordered compressed part sources.
template <SerializableRecord R>
[[nodiscard]] Result<std::vector<R>> decode(std::vector<std::unique_ptr<std::streambuf>> parts) {
    GzChunkedDecoder<R> decoder(std::move(parts));
    std::vector<R> records;
    for (;;) {
        auto record = decoder.next();
        if (!record) {
            return std::unexpected(record.error());
        }
        if (!record->has_value()) {
            return records;
        }
        records.push_back(std::move(**record));
    }
}

/// @brief Decode every record from in-memory parts.
template <SerializableRecord R>
[[nodiscard]] Result<std::vector<R>> decode(std::span<const Part> parts) {
    return decode<R>(memoryPartSources(parts));
}

}  // namespace gzc::format

#endif  // GZC_FORMAT_GZCHUNKED_H
