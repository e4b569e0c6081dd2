// =============================================================================
// gzchunk - Stream Joiner Tests
// =============================================================================

#include "gzc/io/joined_stream.h"

#include <gtest/gtest.h>

#include <string>

#include "gzc/io/memory_stream.h"

namespace gzc::io {
namespace {

std::unique_ptr<std::streambuf> source(const std::string& text) {
    return std::make_unique<OwningMemoryStreamBuf>(std::vector<std::uint8_t>(text.begin(), text.end()));
}

std::string drain(std::streambuf& buf, std::streamsize step) {
    std::string result;
    std::string chunk(static_cast<std::size_t>(step), '\0');
    for (;;) {
        const auto n = buf.sgetn(chunk.data(), step);
        if (n <= 0) {
            return result;
        }
        result.append(chunk.data(), static_cast<std::size_t>(n));
    }
}

TEST(JoinedStreamBufTest, ConcatenatesInOrderWithoutSeparators) {
    std::vector<std::unique_ptr<std::streambuf>> sources;
    sources.push_back(source("alpha"));
    sources.push_back(source(""));
    sources.push_back(source("beta"));
    sources.push_back(source("gamma"));

    JoinedStreamBuf joined(std::move(sources), 3);

    EXPECT_EQ(drain(joined, 4), "alphabetagamma");
    EXPECT_EQ(joined.sourceCount(), 4u);
    EXPECT_EQ(joined.currentIndex(), 4u);
}

TEST(JoinedStreamBufTest, NoSourcesIsImmediatelyExhausted) {
    JoinedStreamBuf joined(std::vector<std::unique_ptr<std::streambuf>>{});

    EXPECT_EQ(joined.sgetc(), std::streambuf::traits_type::eof());
    EXPECT_EQ(drain(joined, 16), "");
}

TEST(JoinedStreamBufTest, CursorFollowsTheSourceBeingRead) {
    std::vector<std::unique_ptr<std::streambuf>> sources;
    sources.push_back(source("ab"));
    sources.push_back(source("cd"));

    JoinedStreamBuf joined(std::move(sources), 64);

    EXPECT_EQ(joined.sbumpc(), 'a');
    EXPECT_EQ(joined.currentIndex(), 0u);
    EXPECT_EQ(joined.sbumpc(), 'b');
    EXPECT_EQ(joined.sbumpc(), 'c');
    EXPECT_EQ(joined.currentIndex(), 1u);
    EXPECT_EQ(joined.sbumpc(), 'd');
    EXPECT_EQ(joined.sbumpc(), std::streambuf::traits_type::eof());
    EXPECT_EQ(joined.sbumpc(), std::streambuf::traits_type::eof());
}

}  // namespace
}  // namespace gzc::io
