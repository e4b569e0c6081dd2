// =============================================================================
// gzchunk - Variable-Length Integer Implementation
// =============================================================================

#include "gzc/format/varint.h"

#include <fmt/format.h>

namespace gzc::format {

namespace {

constexpr std::uint8_t kContinuationBit = 0x80;
constexpr std::uint8_t kPayloadMask = 0x7F;

/// @brief The tenth byte may only carry the top bit of a 64-bit value.
constexpr std::uint8_t kLastByteLimit = 0x01;

}  // namespace

std::size_t uvarintSize(std::uint64_t value) noexcept {
    std::size_t size = 1;
    while (value >= kContinuationBit) {
        value >>= 7;
        ++size;
    }
    return size;
}

std::size_t encodeUvarint(std::uint64_t value, std::uint8_t* output) noexcept {
    std::size_t i = 0;
    while (value >= kContinuationBit) {
        output[i++] = static_cast<std::uint8_t>((value & kPayloadMask) | kContinuationBit);
        value >>= 7;
    }
    output[i++] = static_cast<std::uint8_t>(value);
    return i;
}

void appendUvarint(std::vector<std::uint8_t>& out, std::uint64_t value) {
    std::uint8_t buffer[kMaxVarintBytes];
    const std::size_t len = encodeUvarint(value, buffer);
    out.insert(out.end(), buffer, buffer + len);
}

void appendSvarint(std::vector<std::uint8_t>& out, std::int64_t value) {
    appendUvarint(out, zigzagEncode(value));
}

Result<std::uint64_t> decodeUvarint(std::span<const std::uint8_t> data, std::size_t& bytesRead) {
    std::uint64_t result = 0;
    std::size_t shift = 0;
    bytesRead = 0;

    for (std::size_t i = 0; i < data.size() && i < kMaxVarintBytes; ++i) {
        const std::uint8_t byte = data[i];
        if (i == kMaxVarintBytes - 1 && byte > kLastByteLimit) {
            return makeError<std::uint64_t>(ErrorCode::kMalformedStream,
                                            "varint overflows 64 bits");
        }

        result |= static_cast<std::uint64_t>(byte & kPayloadMask) << shift;

        if ((byte & kContinuationBit) == 0) {
            bytesRead = i + 1;
            return result;
        }
        shift += 7;
    }

    if (data.size() >= kMaxVarintBytes) {
        return makeError<std::uint64_t>(ErrorCode::kMalformedStream, "varint overflows 64 bits");
    }
    return makeError<std::uint64_t>(ErrorCode::kMalformedStream,
                                    fmt::format("varint truncated after {} bytes", data.size()));
}

std::optional<std::uint64_t> readUvarint(std::streambuf& source) {
    using Traits = std::streambuf::traits_type;

    std::uint64_t result = 0;
    std::size_t shift = 0;

    for (std::size_t i = 0; i < kMaxVarintBytes; ++i) {
        const auto ch = source.sbumpc();
        if (Traits::eq_int_type(ch, Traits::eof())) {
            if (i == 0) {
                return std::nullopt;
            }
            throw MalformedStreamError(
                fmt::format("stream ended inside a length marker after {} bytes", i));
        }

        const auto byte = static_cast<std::uint8_t>(Traits::to_char_type(ch));
        if (i == kMaxVarintBytes - 1 && byte > kLastByteLimit) {
            throw MalformedStreamError("length marker overflows 64 bits");
        }

        result |= static_cast<std::uint64_t>(byte & kPayloadMask) << shift;
        if ((byte & kContinuationBit) == 0) {
            return result;
        }
        shift += 7;
    }

    // Unreachable: the tenth byte either terminates or fails the limit check.
    throw MalformedStreamError("length marker overflows 64 bits");
}

// =============================================================================
// ByteCursor Implementation
// =============================================================================

Result<std::uint64_t> ByteCursor::readUvarint() {
    std::size_t used = 0;
    auto value = decodeUvarint(data_.subspan(pos_), used);
    if (!value) {
        return makeError<std::uint64_t>(
            Error{value.error().code(),
                  fmt::format("{} at byte {}", value.error().message(), pos_)});
    }
    pos_ += used;
    return value;
}

Result<std::int64_t> ByteCursor::readSvarint() {
    auto value = readUvarint();
    if (!value) {
        return std::unexpected(value.error());
    }
    return zigzagDecode(*value);
}

Result<std::span<const std::uint8_t>> ByteCursor::readBytes(std::size_t count) {
    if (count > remaining()) {
        return makeError<std::span<const std::uint8_t>>(
            ErrorCode::kMalformedStream,
            fmt::format("need {} bytes at byte {}, {} remain", count, pos_, remaining()));
    }
    auto bytes = data_.subspan(pos_, count);
    pos_ += count;
    return bytes;
}

}  // namespace gzc::format
