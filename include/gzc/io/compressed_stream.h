// =============================================================================
// gzchunk - Gzip Stream Support
// =============================================================================
// zlib-backed gzip compression and decompression for individual parts.
//
// - Compression: level selection (none, default, best, or an explicit 0-9)
// - GzipEncoder: push-style compressor whose output size can be observed
//   while it is being fed, so the partitioner can seal a part on time
// - GzipStreamBuf: pull-style std::streambuf inflating one gzip member
//
// Every part is a complete gzip member (RFC 1952) and decompresses with any
// standard gzip tool.
// =============================================================================

#ifndef GZC_IO_COMPRESSED_STREAM_H
#define GZC_IO_COMPRESSED_STREAM_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <streambuf>
#include <string>
#include <string_view>
#include <vector>

#include "gzc/common/error.h"
#include "gzc/common/types.h"

namespace gzc::io {

// =============================================================================
// Compression Level
// =============================================================================

/// @brief gzip compression level on the zlib 0-9 scale.
/// @note A default-constructed Compression uses level 5.
class Compression {
public:
    constexpr Compression() noexcept = default;

    /// @brief Construct an explicit level.
    /// @throws UsageError if level is greater than 9.
    explicit Compression(std::uint32_t level);

    /// @brief Stored (level 0) deflate blocks.
    [[nodiscard]] static constexpr Compression none() noexcept { return Compression(0, Tag{}); }

    /// @brief Level 9.
    [[nodiscard]] static constexpr Compression best() noexcept { return Compression(9, Tag{}); }

    /// @brief Level 1.
    [[nodiscard]] static constexpr Compression fast() noexcept { return Compression(1, Tag{}); }

    [[nodiscard]] constexpr std::uint32_t level() const noexcept { return level_; }

    /// @brief Human-readable name: "none", "default", "best" or the number.
    [[nodiscard]] std::string name() const;

    constexpr bool operator==(const Compression&) const noexcept = default;

private:
    struct Tag {};
    constexpr Compression(std::uint32_t level, Tag) noexcept : level_(level) {}

    std::uint32_t level_ = kDefaultCompressionLevel;
};

/// @brief Parse "none", "fast", "default", "best" or a number 0-9.
[[nodiscard]] Result<Compression> parseCompression(std::string_view text);

// =============================================================================
// GzipEncoder
// =============================================================================

/// @brief Incremental gzip compressor writing into an owned byte buffer.
///
/// Satisfies the ByteSink concept so it can be fed by io::copyUntil().
/// compressedSize() reports the bytes zlib has emitted so far, which lags
/// behind the input by whatever zlib still holds internally.
class GzipEncoder {
public:
    explicit GzipEncoder(Compression compression = Compression{},
                         std::size_t bufferSize = kDefaultStreamBufferSize);

    ~GzipEncoder();

    GzipEncoder(const GzipEncoder&) = delete;
    GzipEncoder& operator=(const GzipEncoder&) = delete;

    GzipEncoder(GzipEncoder&& other) noexcept;
    GzipEncoder& operator=(GzipEncoder&& other) noexcept;

    /// @brief Compress data into the output buffer.
    /// @throws CodecError(kCompressionFailed) on zlib failure,
    ///         CodecError(kInvalidState) after finish().
    void write(std::span<const std::uint8_t> data);

    /// @brief Bytes of compressed output produced so far.
    [[nodiscard]] std::size_t compressedSize() const noexcept { return output_.size(); }

    /// @brief Uncompressed bytes accepted so far.
    [[nodiscard]] std::uint64_t bytesIn() const noexcept { return bytesIn_; }

    [[nodiscard]] bool finished() const noexcept { return finished_; }

    /// @brief Flush the remaining data, write the gzip trailer and release the
    ///        completed member.
    /// @throws CodecError(kCompressionFailed) on zlib failure,
    ///         CodecError(kInvalidState) if called twice.
    [[nodiscard]] std::vector<std::uint8_t> finish();

private:
    void deflateInto(int flush);
    void cleanupZlib() noexcept;

    Compression compression_;
    std::vector<std::uint8_t> scratch_;
    std::vector<std::uint8_t> output_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    std::uint64_t bytesIn_ = 0;
    bool finished_ = false;
};

/// @brief Compress a byte buffer into one gzip member.
[[nodiscard]] std::vector<std::uint8_t> gzipCompress(std::span<const std::uint8_t> data,
                                                     Compression compression = Compression{});

// =============================================================================
// GzipStreamBuf
// =============================================================================

/// @brief Stream buffer inflating one gzip member read from a source buffer.
///
/// Errors surface as exceptions from underflow(), so callers read through
/// the streambuf interface directly instead of wrapping it in an istream,
/// which would turn them into a failbit.
class GzipStreamBuf : public std::streambuf {
public:
    /// @param source Compressed bytes; ownership is taken.
    /// @param context Attached to every error raised (usually the part index).
    /// @param bufferSize Internal buffer size.
    explicit GzipStreamBuf(std::unique_ptr<std::streambuf> source, ErrorContext context = {},
                           std::size_t bufferSize = kDefaultStreamBufferSize);

    ~GzipStreamBuf() override;

    GzipStreamBuf(const GzipStreamBuf&) = delete;
    GzipStreamBuf& operator=(const GzipStreamBuf&) = delete;

    /// @brief Whether the gzip trailer has been consumed.
    [[nodiscard]] bool streamEnded() const noexcept { return streamEnd_; }

    /// @brief Compressed bytes taken from the source so far.
    [[nodiscard]] std::uint64_t compressedBytesRead() const noexcept { return compressedRead_; }

protected:
    /// @throws CodecError(kDecompressionFailed) on corrupt data,
    ///         MalformedStreamError if the source ends inside the member.
    int_type underflow() override;

private:
    void initZlib();
    void cleanupZlib() noexcept;

    /// @brief Inflate into the output buffer until some output is available
    ///        or the member ends.
    /// @return Number of bytes produced.
    std::size_t decompress();

    std::unique_ptr<std::streambuf> source_;
    ErrorContext context_;
    std::vector<std::uint8_t> inputBuffer_;
    std::vector<char> outputBuffer_;

    /// @brief zlib stream state (opaque pointer).
    void* zlibStream_ = nullptr;

    std::uint64_t compressedRead_ = 0;
    bool sourceEnd_ = false;
    bool streamEnd_ = false;
};

/// @brief Decompress one complete gzip member.
/// @throws CodecError, MalformedStreamError as GzipStreamBuf.
[[nodiscard]] std::vector<std::uint8_t> gzipDecompress(std::span<const std::uint8_t> data);

}  // namespace gzc::io

#endif  // GZC_IO_COMPRESSED_STREAM_H
