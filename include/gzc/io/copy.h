// =============================================================================
// gzchunk - Bounded Copy
// =============================================================================
// Chunked copy from a std::streambuf into a byte sink that stops as soon as a
// caller-supplied predicate, evaluated against the sink, becomes true.
//
// The partitioning encoder uses it to feed the framed stream into a gzip
// compressor until the compressed output reaches the part size:
//
//   auto copied = io::copyUntil(framed, encoder, [&](const GzipEncoder& e) {
//       return e.compressedSize() >= partSize;
//   });
// =============================================================================

#ifndef GZC_IO_COPY_H
#define GZC_IO_COPY_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <streambuf>
#include <utility>
#include <vector>

#include "gzc/common/error.h"
#include "gzc/common/types.h"

namespace gzc::io {

// =============================================================================
// Sink Concept
// =============================================================================

/// @brief Concept for byte sinks accepted by copyUntil().
/// @note write() must consume the whole span or throw.
template <typename S>
concept ByteSink = requires(S& sink, std::span<const std::uint8_t> data) {
    sink.write(data);
};

/// @brief Byte sink appending to a caller-owned vector.
class VectorSink {
public:
    explicit VectorSink(std::vector<std::uint8_t>& target) : target_(&target) {}

    void write(std::span<const std::uint8_t> data) {
        target_->insert(target_->end(), data.begin(), data.end());
    }

    [[nodiscard]] std::size_t size() const noexcept { return target_->size(); }

private:
    std::vector<std::uint8_t>* target_;
};

// =============================================================================
// copyUntil
// =============================================================================

/// @brief Copy bytes from source to sink until stop(sink) holds or the source
///        is exhausted.
/// @param source Byte source, read through sgetn().
/// @param sink Byte sink receiving every byte taken from the source.
/// @param stop Predicate evaluated after each transfer.
/// @param chunkSize Upper bound on the bytes moved per step (must be > 0).
/// @return Number of bytes transferred.
/// @note stop is not evaluated when the first read yields no data.
/// @throws UsageError if chunkSize is zero; source and sink exceptions
///         propagate unchanged and leave the sink with partial content.
template <ByteSink Sink, typename Stop>
    requires std::predicate<Stop&, const Sink&>
std::uint64_t copyUntil(std::streambuf& source, Sink& sink, Stop&& stop,
                        std::size_t chunkSize = kDefaultCopyChunkSize) {
    if (chunkSize == 0) {
        throw UsageError("copy chunk size must be positive");
    }

    std::vector<std::uint8_t> buffer(chunkSize);
    std::uint64_t copied = 0;

    for (;;) {
        const auto count = source.sgetn(reinterpret_cast<char*>(buffer.data()),
                                        static_cast<std::streamsize>(buffer.size()));
        if (count <= 0) {
            break;
        }

        sink.write(std::span<const std::uint8_t>(buffer.data(), static_cast<std::size_t>(count)));
        copied += static_cast<std::uint64_t>(count);

        if (stop(std::as_const(sink))) {
            break;
        }
    }

    return copied;
}

}  // namespace gzc::io

#endif  // GZC_IO_COPY_H
