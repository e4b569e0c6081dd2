// =============================================================================
// gzchunk - In-Memory Byte Source
// =============================================================================
// Read-only std::streambuf over a contiguous byte range, used to feed
// in-memory parts to the decoder without copying them.
// =============================================================================

#ifndef GZC_IO_MEMORY_STREAM_H
#define GZC_IO_MEMORY_STREAM_H

#include <cstdint>
#include <span>
#include <streambuf>
#include <vector>

namespace gzc::io {

/// @brief Read-only stream buffer viewing a byte span.
/// @note The viewed bytes must outlive the buffer.
class MemoryStreamBuf : public std::streambuf {
public:
    explicit MemoryStreamBuf(std::span<const std::uint8_t> data);

    /// @brief Number of bytes not yet consumed.
    [[nodiscard]] std::size_t remaining() const noexcept;

protected:
    std::streamsize showmanyc() override;
};

namespace detail {

struct ByteStorage {
    std::vector<std::uint8_t> bytes;
};

}  // namespace detail

/// @brief Read-only stream buffer owning its bytes.
// ByteStorage is listed first so it is constructed before the view.
class OwningMemoryStreamBuf : private detail::ByteStorage, public MemoryStreamBuf {
public:
    explicit OwningMemoryStreamBuf(std::vector<std::uint8_t> data);
};

}  // namespace gzc::io

#endif  // GZC_IO_MEMORY_STREAM_H
