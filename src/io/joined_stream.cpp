// =============================================================================
// gzchunk - Stream Joiner Implementation
// =============================================================================

#include "gzc/io/joined_stream.h"

#include <algorithm>
#include <utility>

namespace gzc::io {

JoinedStreamBuf::JoinedStreamBuf(std::vector<std::unique_ptr<std::streambuf>> sources,
                                 std::size_t bufferSize)
    : sources_(std::move(sources)), buffer_(std::max<std::size_t>(bufferSize, 1)) {}

JoinedStreamBuf::int_type JoinedStreamBuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    while (current_ < sources_.size()) {
        auto& source = sources_[current_];
        if (source) {
            const auto n =
                source->sgetn(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
            if (n > 0) {
                setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
                return traits_type::to_int_type(*gptr());
            }
            source.reset();
        }
        ++current_;
    }

    return traits_type::eof();
}

}  // namespace gzc::io
