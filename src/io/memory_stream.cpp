// =============================================================================
// gzchunk - In-Memory Byte Source Implementation
// =============================================================================

#include "gzc/io/memory_stream.h"

#include <utility>

namespace gzc::io {

MemoryStreamBuf::MemoryStreamBuf(std::span<const std::uint8_t> data) {
    // The get area is never written through.
    auto* begin = const_cast<char*>(reinterpret_cast<const char*>(data.data()));
    setg(begin, begin, begin + data.size());
}

std::size_t MemoryStreamBuf::remaining() const noexcept {
    return static_cast<std::size_t>(egptr() - gptr());
}

std::streamsize MemoryStreamBuf::showmanyc() {
    const auto left = static_cast<std::streamsize>(remaining());
    return left > 0 ? left : -1;
}

OwningMemoryStreamBuf::OwningMemoryStreamBuf(std::vector<std::uint8_t> data)
    : detail::ByteStorage{std::move(data)}, MemoryStreamBuf(std::span<const std::uint8_t>(bytes)) {}

}  // namespace gzc::io
