// =============================================================================
// gzchunk - Common Type Definitions
// =============================================================================
// Core type definitions for the gzchunk library.
//
// This module defines:
// - Part: one compressed fragment of a framed stream
// - Codec-wide constants (default part size, copy chunk size, frame limits)
// - C++20 concepts binding record types and record producers
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef GZC_COMMON_TYPES_H
#define GZC_COMMON_TYPES_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

#include "gzc/common/error.h"

namespace gzc {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief One independently decompressible gzip member of a framed stream.
using Part = std::vector<std::uint8_t>;

/// @brief Type alias for part indices (0-based, in production order).
using PartIndex = std::uint32_t;

/// @brief Type alias for record indices (0-based, in stream order).
using RecordIndex = std::uint64_t;

/// @brief Type alias for xxHash64 checksum values.
using Checksum = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default compression level (zlib scale 0-9).
inline constexpr std::uint32_t kDefaultCompressionLevel = 5;

inline constexpr std::uint32_t kMinCompressionLevel = 0;

inline constexpr std::uint32_t kMaxCompressionLevel = 9;

/// @brief Default soft ceiling on the compressed size of a part.
inline constexpr std::uint64_t kDefaultPartSize = 1 * 1024 * 1024;  // 1 MiB

/// @brief Default number of bytes moved per bounded copy step.
inline constexpr std::size_t kDefaultCopyChunkSize = 1024;

/// @brief Maximum encoded size of a uvarint length marker.
inline constexpr std::size_t kMaxVarintBytes = 10;

/// @brief Largest payload a frame may declare before the stream is considered
///        malformed.
inline constexpr std::uint64_t kMaxFrameSize = 256ULL * 1024 * 1024;  // 256 MiB

/// @brief Default buffer size for zlib and stream adapters.
inline constexpr std::size_t kDefaultStreamBufferSize = 64 * 1024;

// =============================================================================
// C++20 Concepts
// =============================================================================

/// @brief Concept for record types carried by the codec.
/// @note serialize() appends the record's bytes to the buffer; deserialize()
///       parses exactly one record from the given bytes.
template <typename T>
concept SerializableRecord =
    std::movable<T> &&
    requires(const T& record, std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes) {
        record.serialize(out);
        { T::deserialize(bytes) } -> std::same_as<Result<T>>;
    };

namespace detail {

template <typename T>
struct OptionalValue {};

template <typename T>
struct OptionalValue<std::optional<T>> {
    using type = T;
};

}  // namespace detail

/// @brief Concept for lazy record producers.
/// @note A producer is a callable returning std::optional<R>; std::nullopt
///       marks the end of the sequence.
template <typename P>
concept RecordProducer =
    std::invocable<P&> &&
    requires { typename detail::OptionalValue<std::invoke_result_t<P&>>::type; } &&
    SerializableRecord<typename detail::OptionalValue<std::invoke_result_t<P&>>::type>;

/// @brief Record type yielded by a producer.
template <RecordProducer P>
using ProducedRecord = typename detail::OptionalValue<std::invoke_result_t<P&>>::type;

/// @brief Adapt an iterator range into a record producer.
/// @note The range must outlive the producer; records are copied out.
template <std::input_iterator It>
[[nodiscard]] auto fromRange(It first, It last) {
    using Value = std::iter_value_t<It>;
    return [first, last]() mutable -> std::optional<Value> {
        if (first == last) {
            return std::nullopt;
        }
        Value value = *first;
        ++first;
        return value;
    };
}

/// @brief Adapt a container into a record producer.
template <typename Range>
[[nodiscard]] auto fromRange(const Range& range) {
    return fromRange(std::begin(range), std::end(range));
}

}  // namespace gzc

#endif  // GZC_COMMON_TYPES_H
