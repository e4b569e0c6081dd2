// =============================================================================
// gzchunk - Bounded Copy Tests
// =============================================================================

#include "gzc/io/copy.h"

#include <gtest/gtest.h>

#include <numeric>
#include <vector>

#include "gzc/io/memory_stream.h"

namespace gzc::io {
namespace {

std::vector<std::uint8_t> sequence(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    std::iota(data.begin(), data.end(), std::uint8_t{0});
    return data;
}

/// @brief Sink that fails on its Nth write after keeping the earlier ones.
class FailingSink {
public:
    explicit FailingSink(int failOnWrite) : failOnWrite_(failOnWrite) {}

    void write(std::span<const std::uint8_t> data) {
        if (++writes_ == failOnWrite_) {
            throw IOError("sink closed");
        }
        bytes_.insert(bytes_.end(), data.begin(), data.end());
    }

    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const noexcept { return bytes_; }

private:
    int failOnWrite_;
    int writes_ = 0;
    std::vector<std::uint8_t> bytes_;
};

/// @brief Source that serves some bytes and then fails.
class FailingSource : public std::streambuf {
public:
    explicit FailingSource(std::size_t goodBytes) : data_(goodBytes, 'x') {
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

protected:
    int_type underflow() override { throw IOError("source read failed"); }

private:
    std::vector<char> data_;
};

TEST(CopyUntilTest, CopiesWholeSourceWhenNeverStopped) {
    const auto data = sequence(10000);
    MemoryStreamBuf source(data);
    std::vector<std::uint8_t> target;
    VectorSink sink(target);

    const auto copied = copyUntil(source, sink, [](const VectorSink&) { return false; }, 1024);

    EXPECT_EQ(copied, data.size());
    EXPECT_EQ(target, data);
}

TEST(CopyUntilTest, StopsAfterTheStepThatSatisfiesThePredicate) {
    const auto data = sequence(10000);
    MemoryStreamBuf source(data);
    std::vector<std::uint8_t> target;
    VectorSink sink(target);

    const auto copied = copyUntil(
        source, sink, [](const VectorSink& s) { return s.size() >= 2500; }, 1000);

    EXPECT_EQ(copied, 3000u);
    EXPECT_EQ(target.size(), 3000u);
    EXPECT_EQ(source.remaining(), 7000u);
}

TEST(CopyUntilTest, ResumesWhereThePreviousCopyStopped) {
    const auto data = sequence(5000);
    MemoryStreamBuf source(data);
    std::vector<std::uint8_t> target;
    VectorSink sink(target);
    auto stop = [](const VectorSink& s) { return s.size() % 2000 == 0; };

    EXPECT_EQ(copyUntil(source, sink, stop, 1000), 2000u);
    EXPECT_EQ(copyUntil(source, sink, stop, 1000), 2000u);
    EXPECT_EQ(copyUntil(source, sink, stop, 1000), 1000u);
    EXPECT_EQ(copyUntil(source, sink, stop, 1000), 0u);
    EXPECT_EQ(target, data);
}

TEST(CopyUntilTest, EmptySourceNeverEvaluatesPredicate) {
    MemoryStreamBuf source(std::span<const std::uint8_t>{});
    std::vector<std::uint8_t> target;
    VectorSink sink(target);
    int evaluations = 0;

    const auto copied = copyUntil(source, sink, [&evaluations](const VectorSink&) {
        ++evaluations;
        return true;
    });

    EXPECT_EQ(copied, 0u);
    EXPECT_EQ(evaluations, 0);
    EXPECT_TRUE(target.empty());
}

TEST(CopyUntilTest, PredicateSeesEveryStep) {
    const auto data = sequence(4096);
    MemoryStreamBuf source(data);
    std::vector<std::uint8_t> target;
    VectorSink sink(target);
    int evaluations = 0;

    copyUntil(source, sink, [&evaluations](const VectorSink&) {
        ++evaluations;
        return false;
    }, 1024);

    EXPECT_EQ(evaluations, 4);
}

TEST(CopyUntilTest, ZeroChunkSizeIsRejected) {
    const auto data = sequence(16);
    MemoryStreamBuf source(data);
    std::vector<std::uint8_t> target;
    VectorSink sink(target);

    EXPECT_THROW(copyUntil(source, sink, [](const VectorSink&) { return false; }, 0), UsageError);
}

TEST(CopyUntilTest, SinkFailurePropagatesWithPartialContent) {
    const auto data = sequence(4096);
    MemoryStreamBuf source(data);
    FailingSink sink(3);

    EXPECT_THROW(copyUntil(source, sink, [](const FailingSink&) { return false; }, 1024),
                 IOError);
    EXPECT_EQ(sink.bytes().size(), 2048u);
}

TEST(CopyUntilTest, SourceFailurePropagates) {
    FailingSource source(100);
    std::vector<std::uint8_t> target;
    VectorSink sink(target);

    EXPECT_THROW(copyUntil(source, sink, [](const VectorSink&) { return false; }, 64), IOError);
}

}  // namespace
}  // namespace gzc::io
