// =============================================================================
// gzchunk - Gzip Stream Implementation
// =============================================================================

#include "gzc/io/compressed_stream.h"

#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstring>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include "gzc/io/memory_stream.h"

namespace gzc::io {

namespace {

/// @brief gzip wrapper instead of raw zlib framing.
constexpr int kGzipWindowBits = 16 + MAX_WBITS;

constexpr int kMemLevel = 8;

std::string zlibMessage(const z_stream* stream, int ret) {
    if (stream != nullptr && stream->msg != nullptr) {
        return std::string(stream->msg);
    }
    return std::string(zError(ret));
}

}  // namespace

// =============================================================================
// Compression Implementation
// =============================================================================

Compression::Compression(std::uint32_t level) : level_(level) {
    if (level > kMaxCompressionLevel) {
        throw UsageError(fmt::format("compression level {} is out of range [{}, {}]", level,
                                     kMinCompressionLevel, kMaxCompressionLevel));
    }
}

std::string Compression::name() const {
    switch (level_) {
        case 0:
            return "none";
        case 1:
            return "fast";
        case kDefaultCompressionLevel:
            return "default";
        case kMaxCompressionLevel:
            return "best";
        default:
            return std::to_string(level_);
    }
}

Result<Compression> parseCompression(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none") {
        return Compression::none();
    }
    if (lower == "fast") {
        return Compression::fast();
    }
    if (lower == "default") {
        return Compression{};
    }
    if (lower == "best") {
        return Compression::best();
    }

    std::uint32_t level = 0;
    const auto* first = lower.data();
    const auto* last = lower.data() + lower.size();
    auto [ptr, ec] = std::from_chars(first, last, level);
    if (lower.empty() || ec != std::errc{} || ptr != last) {
        return makeError<Compression>(ErrorCode::kUsageError,
                                      fmt::format("invalid compression '{}'", text));
    }
    if (level > kMaxCompressionLevel) {
        return makeError<Compression>(
            ErrorCode::kUsageError,
            fmt::format("compression level {} is out of range [{}, {}]", level,
                        kMinCompressionLevel, kMaxCompressionLevel));
    }
    return Compression(level);
}

// =============================================================================
// GzipEncoder Implementation
// =============================================================================

GzipEncoder::GzipEncoder(Compression compression, std::size_t bufferSize)
    : compression_(compression), scratch_(std::max<std::size_t>(bufferSize, 1)) {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    int ret = deflateInit2(stream, static_cast<int>(compression_.level()), Z_DEFLATED,
                           kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        delete stream;
        throw CodecError(ErrorCode::kCompressionFailed,
                         "Failed to initialize zlib deflate: " + std::string(zError(ret)));
    }

    zlibStream_ = stream;
}

GzipEncoder::~GzipEncoder() { cleanupZlib(); }

GzipEncoder::GzipEncoder(GzipEncoder&& other) noexcept
    : compression_(other.compression_),
      scratch_(std::move(other.scratch_)),
      output_(std::move(other.output_)),
      zlibStream_(other.zlibStream_),
      bytesIn_(other.bytesIn_),
      finished_(other.finished_) {
    other.zlibStream_ = nullptr;
    other.finished_ = true;
}

GzipEncoder& GzipEncoder::operator=(GzipEncoder&& other) noexcept {
    if (this != &other) {
        cleanupZlib();

        compression_ = other.compression_;
        scratch_ = std::move(other.scratch_);
        output_ = std::move(other.output_);
        zlibStream_ = other.zlibStream_;
        bytesIn_ = other.bytesIn_;
        finished_ = other.finished_;

        other.zlibStream_ = nullptr;
        other.finished_ = true;
    }
    return *this;
}

void GzipEncoder::cleanupZlib() noexcept {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        deflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

void GzipEncoder::write(std::span<const std::uint8_t> data) {
    if (finished_ || zlibStream_ == nullptr) {
        throw CodecError(ErrorCode::kInvalidState, "write to a finished gzip encoder");
    }

    auto* stream = static_cast<z_stream*>(zlibStream_);
    constexpr std::size_t kMaxChunk = std::numeric_limits<uInt>::max();

    while (!data.empty()) {
        const std::size_t take = std::min(data.size(), kMaxChunk);
        stream->next_in = const_cast<Bytef*>(data.data());
        stream->avail_in = static_cast<uInt>(take);
        deflateInto(Z_NO_FLUSH);
        bytesIn_ += take;
        data = data.subspan(take);
    }
}

void GzipEncoder::deflateInto(int flush) {
    auto* stream = static_cast<z_stream*>(zlibStream_);

    for (;;) {
        stream->next_out = scratch_.data();
        stream->avail_out = static_cast<uInt>(scratch_.size());

        int ret = deflate(stream, flush);
        if (ret == Z_STREAM_ERROR) {
            throw CodecError(ErrorCode::kCompressionFailed,
                             "Gzip compression failed: " + zlibMessage(stream, ret));
        }

        const std::size_t produced = scratch_.size() - stream->avail_out;
        output_.insert(output_.end(), scratch_.begin(),
                       scratch_.begin() + static_cast<std::ptrdiff_t>(produced));

        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) {
                return;
            }
            if (ret != Z_OK && ret != Z_BUF_ERROR) {
                throw CodecError(ErrorCode::kCompressionFailed,
                                 "Gzip compression failed: " + zlibMessage(stream, ret));
            }
        } else if (stream->avail_out != 0) {
            // All pending input consumed.
            return;
        }
    }
}

std::vector<std::uint8_t> GzipEncoder::finish() {
    if (finished_ || zlibStream_ == nullptr) {
        throw CodecError(ErrorCode::kInvalidState, "gzip encoder already finished");
    }

    auto* stream = static_cast<z_stream*>(zlibStream_);
    stream->next_in = nullptr;
    stream->avail_in = 0;
    deflateInto(Z_FINISH);

    finished_ = true;
    cleanupZlib();
    return std::move(output_);
}

std::vector<std::uint8_t> gzipCompress(std::span<const std::uint8_t> data,
                                       Compression compression) {
    GzipEncoder encoder(compression);
    encoder.write(data);
    return encoder.finish();
}

// =============================================================================
// GzipStreamBuf Implementation
// =============================================================================

GzipStreamBuf::GzipStreamBuf(std::unique_ptr<std::streambuf> source, ErrorContext context,
                             std::size_t bufferSize)
    : source_(std::move(source)),
      context_(std::move(context)),
      inputBuffer_(std::max<std::size_t>(bufferSize, 1)),
      outputBuffer_(std::max<std::size_t>(bufferSize, 1)) {
    if (!source_) {
        throw UsageError("gzip stream requires a source");
    }
    initZlib();
}

GzipStreamBuf::~GzipStreamBuf() { cleanupZlib(); }

void GzipStreamBuf::initZlib() {
    auto* stream = new z_stream;
    std::memset(stream, 0, sizeof(z_stream));

    int ret = inflateInit2(stream, kGzipWindowBits);
    if (ret != Z_OK) {
        delete stream;
        throw CodecError(ErrorCode::kDecompressionFailed,
                         "Failed to initialize zlib inflate: " + std::string(zError(ret)),
                         context_);
    }

    zlibStream_ = stream;
}

void GzipStreamBuf::cleanupZlib() noexcept {
    if (zlibStream_) {
        auto* stream = static_cast<z_stream*>(zlibStream_);
        inflateEnd(stream);
        delete stream;
        zlibStream_ = nullptr;
    }
}

GzipStreamBuf::int_type GzipStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    const std::size_t decompressed = decompress();
    if (decompressed == 0) {
        return traits_type::eof();
    }

    setg(outputBuffer_.data(), outputBuffer_.data(), outputBuffer_.data() + decompressed);
    return traits_type::to_int_type(*gptr());
}

std::size_t GzipStreamBuf::decompress() {
    auto* stream = static_cast<z_stream*>(zlibStream_);

    while (!streamEnd_) {
        if (stream->avail_in == 0 && !sourceEnd_) {
            const auto bytesRead =
                source_->sgetn(reinterpret_cast<char*>(inputBuffer_.data()),
                               static_cast<std::streamsize>(inputBuffer_.size()));
            if (bytesRead > 0) {
                stream->next_in = inputBuffer_.data();
                stream->avail_in = static_cast<uInt>(bytesRead);
                compressedRead_ += static_cast<std::uint64_t>(bytesRead);
            } else {
                sourceEnd_ = true;
            }
        }

        if (stream->avail_in == 0 && sourceEnd_) {
            throw MalformedStreamError(
                fmt::format("gzip member truncated after {} compressed bytes", compressedRead_),
                context_);
        }

        stream->next_out = reinterpret_cast<Bytef*>(outputBuffer_.data());
        stream->avail_out = static_cast<uInt>(outputBuffer_.size());

        int ret = inflate(stream, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) {
            streamEnd_ = true;
        } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
            throw CodecError(ErrorCode::kDecompressionFailed,
                             "Gzip decompression failed: " + zlibMessage(stream, ret), context_);
        }

        const std::size_t produced = outputBuffer_.size() - stream->avail_out;
        if (produced > 0) {
            return produced;
        }
    }

    return 0;
}

std::vector<std::uint8_t> gzipDecompress(std::span<const std::uint8_t> data) {
    GzipStreamBuf buf(std::make_unique<MemoryStreamBuf>(data));

    std::vector<std::uint8_t> result;
    std::vector<char> chunk(kDefaultStreamBufferSize);
    for (;;) {
        const auto n = buf.sgetn(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (n <= 0) {
            break;
        }
        result.insert(result.end(), chunk.begin(), chunk.begin() + n);
    }
    return result;
}

}  // namespace gzc::io
