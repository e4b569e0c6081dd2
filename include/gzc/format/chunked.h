// =============================================================================
// gzchunk - Chunked Framing
// =============================================================================
// Length-prefixed framing of serialized records.
//
// Frame layout (repeated back-to-back, no padding):
//
//   +-------------------------+------------------------+
//   | uvarint payload length  | payload (length bytes) |
//   +-------------------------+------------------------+
//
// - ChunkedStreamBuf: lazily turns a record producer into the framed byte
//   stream, one frame per underflow(); the stream is never materialized.
// - ChunkedDecoder: reads frames back from any std::streambuf and hands out
//   one record per pull.
//
// A stream may end only at a frame boundary. Anything else is malformed.
// =============================================================================

#ifndef GZC_FORMAT_CHUNKED_H
#define GZC_FORMAT_CHUNKED_H

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <streambuf>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "gzc/common/error.h"
#include "gzc/common/types.h"
#include "gzc/format/varint.h"

namespace gzc::format {

// =============================================================================
// ChunkedStreamBuf
// =============================================================================

/// @brief Read-only stream buffer producing the framed stream of a producer.
///
/// The frame buffer keeps kMaxVarintBytes of headroom in front of the
/// payload; the record serializes straight into it and the length marker is
/// written right-aligned into the headroom, so no payload copy is needed.
template <RecordProducer P>
class ChunkedStreamBuf : public std::streambuf {
public:
    using Record = ProducedRecord<P>;

    explicit ChunkedStreamBuf(P producer) : producer_(std::move(producer)) {}

    ChunkedStreamBuf(const ChunkedStreamBuf&) = delete;
    ChunkedStreamBuf& operator=(const ChunkedStreamBuf&) = delete;

    /// @brief Number of records framed so far.
    [[nodiscard]] RecordIndex recordsEncoded() const noexcept { return records_; }

    /// @brief Number of framed bytes made available so far.
    [[nodiscard]] std::uint64_t bytesFramed() const noexcept { return bytes_; }

    /// @brief Whether the producer has signalled the end of its sequence.
    [[nodiscard]] bool exhausted() const noexcept { return exhausted_; }

protected:
    /// @throws FormatError if a record serializes to more than kMaxFrameSize
    ///         bytes; producer exceptions propagate unchanged.
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }
        if (exhausted_) {
            return traits_type::eof();
        }

        std::optional<Record> record = producer_();
        if (!record) {
            exhausted_ = true;
            return traits_type::eof();
        }

        frame_.assign(kMaxVarintBytes, 0);
        record->serialize(frame_);

        const std::uint64_t payloadSize = frame_.size() - kMaxVarintBytes;
        if (payloadSize > kMaxFrameSize) {
            throw FormatError(fmt::format("record serializes to {} bytes, frame limit is {}",
                                          payloadSize, kMaxFrameSize),
                              ErrorContext{}.withRecord(records_));
        }

        std::uint8_t header[kMaxVarintBytes];
        const std::size_t headerSize = encodeUvarint(payloadSize, header);
        const std::size_t start = kMaxVarintBytes - headerSize;
        std::memcpy(frame_.data() + start, header, headerSize);

        char* base = reinterpret_cast<char*>(frame_.data());
        setg(base + start, base + start, base + frame_.size());

        ++records_;
        bytes_ += frame_.size() - start;
        return traits_type::to_int_type(*gptr());
    }

private:
    P producer_;
    std::vector<std::uint8_t> frame_;
    RecordIndex records_ = 0;
    std::uint64_t bytes_ = 0;
    bool exhausted_ = false;
};

// =============================================================================
// ChunkedDecoder
// =============================================================================

/// @brief Pull-based reader of a framed stream.
///
/// Each next() returns one record, std::nullopt once the source ends at a
/// frame boundary, or an error. There is no resynchronization: after the
/// first error every further pull fails with kInvalidState.
template <SerializableRecord R>
class ChunkedDecoder {
public:
    /// @param source Framed stream; must outlive the decoder.
    explicit ChunkedDecoder(std::streambuf& source) : source_(&source) {}

    [[nodiscard]] Result<std::optional<R>> next() {
        if (failed_) {
            return makeError<std::optional<R>>(ErrorCode::kInvalidState,
                                               "decoding already failed");
        }
        if (finished_) {
            return std::optional<R>{};
        }

        auto result = tryExecute([this]() { return readRecord(); });
        if (!result) {
            failed_ = true;
            return result;
        }
        if (!result->has_value()) {
            finished_ = true;
        }
        return result;
    }

    [[nodiscard]] RecordIndex recordsDecoded() const noexcept { return records_; }

    /// @brief Framed bytes consumed so far.
    [[nodiscard]] std::uint64_t bytesConsumed() const noexcept { return offset_; }

    [[nodiscard]] bool failed() const noexcept { return failed_; }

private:
    ErrorContext frameContext() const {
        ErrorContext context;
        context.withRecord(records_).withOffset(offset_);
        return context;
    }

    std::optional<std::uint64_t> readLength() {
        try {
            return readUvarint(*source_);
        } catch (const MalformedStreamError& ex) {
            // Keep the part index a truncated gzip part already attached.
            ErrorContext context = ex.context().value_or(ErrorContext{});
            context.withRecord(records_).withOffset(offset_);
            throw MalformedStreamError(ex.message(), std::move(context));
        }
    }

    std::optional<R> readRecord() {
        const auto length = readLength();
        if (!length) {
            return std::nullopt;
        }

        if (*length > kMaxFrameSize) {
            throw MalformedStreamError(
                fmt::format("frame declares {} bytes, limit is {}", *length, kMaxFrameSize),
                frameContext());
        }

        payload_.clear();
        std::uint64_t remaining = *length;
        while (remaining > 0) {
            const std::size_t step =
                static_cast<std::size_t>(std::min<std::uint64_t>(remaining, kDefaultStreamBufferSize));
            const std::size_t filled = payload_.size();
            payload_.resize(filled + step);

            const auto n = source_->sgetn(reinterpret_cast<char*>(payload_.data() + filled),
                                          static_cast<std::streamsize>(step));
            if (n < static_cast<std::streamsize>(step)) {
                throw MalformedStreamError(
                    fmt::format("stream ended inside a frame: expected {} payload bytes, got {}",
                                *length, filled + static_cast<std::size_t>(std::max<std::streamsize>(n, 0))),
                    frameContext());
            }
            remaining -= step;
        }

        auto record = R::deserialize(std::span<const std::uint8_t>(payload_));
        if (!record) {
            throw RecordDecodeError(
                fmt::format("record {} could not be decoded: {}", records_,
                            record.error().message()),
                frameContext());
        }

        offset_ += uvarintSize(*length) + *length;
        ++records_;
        return std::optional<R>(std::move(*record));
    }

    std::streambuf* source_;
    std::vector<std::uint8_t> payload_;
    RecordIndex records_ = 0;
    std::uint64_t offset_ = 0;
    bool finished_ = false;
    bool failed_ = false;
};

}  // namespace gzc::format

#endif  // GZC_FORMAT_CHUNKED_H
