// =============================================================================
// gzchunk - Variable-Length Integers
// =============================================================================
// Unsigned LEB128 varints (7 data bits per byte, low group first, high bit
// set on every byte but the last) and ZigZag mapping for signed values.
//
// The chunked framing uses them as length markers; record types use them
// through ByteCursor for their own field encoding.
//
//   300 -> 0xAC 0x02
// =============================================================================

#ifndef GZC_FORMAT_VARINT_H
#define GZC_FORMAT_VARINT_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <streambuf>
#include <vector>

#include "gzc/common/error.h"
#include "gzc/common/types.h"

namespace gzc::format {

// =============================================================================
// ZigZag
// =============================================================================

/// @brief ZigZag encode a signed integer so small magnitudes stay short.
[[nodiscard]] inline constexpr std::uint64_t zigzagEncode(std::int64_t value) noexcept {
    return (static_cast<std::uint64_t>(value) << 1) ^ static_cast<std::uint64_t>(value >> 63);
}

[[nodiscard]] inline constexpr std::int64_t zigzagDecode(std::uint64_t value) noexcept {
    return static_cast<std::int64_t>(value >> 1) ^ -static_cast<std::int64_t>(value & 1);
}

// =============================================================================
// Encoding
// =============================================================================

/// @brief Number of bytes encodeUvarint() writes for value.
[[nodiscard]] std::size_t uvarintSize(std::uint64_t value) noexcept;

/// @brief Encode value into output, which must hold kMaxVarintBytes.
/// @return Number of bytes written.
std::size_t encodeUvarint(std::uint64_t value, std::uint8_t* output) noexcept;

void appendUvarint(std::vector<std::uint8_t>& out, std::uint64_t value);

void appendSvarint(std::vector<std::uint8_t>& out, std::int64_t value);

// =============================================================================
// Decoding
// =============================================================================

/// @brief Decode one uvarint from the front of data.
/// @param bytesRead Set to the encoded length on success.
/// @return kMalformedStream if data ends mid-varint or the value overflows
///         64 bits.
[[nodiscard]] Result<std::uint64_t> decodeUvarint(std::span<const std::uint8_t> data,
                                                  std::size_t& bytesRead);

/// @brief Read one uvarint from a stream buffer.
/// @return std::nullopt on a clean end of stream before the first byte.
/// @throws MalformedStreamError if the stream ends mid-varint or the value
///         overflows 64 bits.
[[nodiscard]] std::optional<std::uint64_t> readUvarint(std::streambuf& source);

// =============================================================================
// ByteCursor
// =============================================================================

/// @brief Sequential reader over a serialized record.
class ByteCursor {
public:
    explicit ByteCursor(std::span<const std::uint8_t> data) noexcept : data_(data) {}

    [[nodiscard]] Result<std::uint64_t> readUvarint();

    [[nodiscard]] Result<std::int64_t> readSvarint();

    /// @brief Take the next count bytes.
    [[nodiscard]] Result<std::span<const std::uint8_t>> readBytes(std::size_t count);

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - pos_; }

    [[nodiscard]] bool atEnd() const noexcept { return pos_ == data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

}  // namespace gzc::format

#endif  // GZC_FORMAT_VARINT_H
