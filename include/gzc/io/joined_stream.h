// =============================================================================
// gzchunk - Stream Joiner
// =============================================================================
// Presents an ordered sequence of byte sources as one continuous stream.
// Used to reassemble decompressed parts into the original framed stream.
// =============================================================================

#ifndef GZC_IO_JOINED_STREAM_H
#define GZC_IO_JOINED_STREAM_H

#include <cstddef>
#include <memory>
#include <streambuf>
#include <vector>

#include "gzc/common/types.h"

namespace gzc::io {

/// @brief Concatenating stream buffer.
///
/// Reads drain sources in order; an exhausted source is released before the
/// next one is touched. Errors raised by a source propagate unchanged.
class JoinedStreamBuf : public std::streambuf {
public:
    explicit JoinedStreamBuf(std::vector<std::unique_ptr<std::streambuf>> sources,
                             std::size_t bufferSize = kDefaultStreamBufferSize);

    JoinedStreamBuf(const JoinedStreamBuf&) = delete;
    JoinedStreamBuf& operator=(const JoinedStreamBuf&) = delete;

    /// @brief Index of the source currently being read.
    [[nodiscard]] std::size_t currentIndex() const noexcept { return current_; }

    [[nodiscard]] std::size_t sourceCount() const noexcept { return sources_.size(); }

protected:
    int_type underflow() override;

private:
    std::vector<std::unique_ptr<std::streambuf>> sources_;
    std::vector<char> buffer_;
    std::size_t current_ = 0;
};

}  // namespace gzc::io

#endif  // GZC_IO_JOINED_STREAM_H
