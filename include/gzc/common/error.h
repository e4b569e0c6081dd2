// =============================================================================
// gzchunk - Error Handling
// =============================================================================
// Every failure carries an ErrorCode. Eager paths (CLI, part files) throw a
// GzcException subclass; the lazy pull boundaries of the codec return
// Result<T> = std::expected<T, Error> and keep the same code and context.
//
// The codes fold onto the process exit codes:
//   0 success, 1 usage, 2 I/O, 3 format, 4 checksum, 5 zlib
// =============================================================================

#ifndef GZC_COMMON_ERROR_H
#define GZC_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <iterator>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace gzc {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @note The first five equal their exit code; toExitCode() folds the rest.
/// @note errorCodeToString() indexes by value, keep the two in step.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,
    kUsageError = 1,
    /// @brief Source or sink read/write failure.
    kIOError = 2,
    /// @brief Bad manifest line or other structural problem outside the stream.
    kFormatError = 3,
    kChecksumError = 4,

    kFileNotFound,
    kFileExists,
    kFileOpenFailed,

    /// @brief Pulling from an encoder or decoder that already failed.
    kInvalidState,

    /// @brief Stream ended inside a frame or a compressed part.
    /// @note Distinct from clean end-of-stream.
    kMalformedStream,

    /// @brief A well-framed payload could not be deserialized.
    kRecordDecodeFailed,

    kCompressionFailed,
    kDecompressionFailed
};

/// @brief Exit code category of @p code.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return 0;
        case ErrorCode::kUsageError:
            return 1;
        case ErrorCode::kIOError:
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileExists:
        case ErrorCode::kFileOpenFailed:
        case ErrorCode::kInvalidState:
            return 2;
        case ErrorCode::kFormatError:
        case ErrorCode::kMalformedStream:
        case ErrorCode::kRecordDecodeFailed:
            return 3;
        case ErrorCode::kChecksumError:
            return 4;
        case ErrorCode::kCompressionFailed:
        case ErrorCode::kDecompressionFailed:
            return 5;
    }
    return 2;
}

/// @brief Short lowercase name used as the "[...]" prefix of messages.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    constexpr std::string_view kNames[] = {
        "success",           "usage error",          "I/O error",
        "format error",      "checksum error",       "file not found",
        "file exists",       "file open failed",     "invalid state",
        "malformed stream",  "record decode failed", "compression failed",
        "decompression failed",
    };
    const auto index = static_cast<std::size_t>(code);
    return index < std::size(kNames) ? kNames[index] : std::string_view{"unknown error"};
}

// =============================================================================
// Error Context
// =============================================================================

/// @brief Where an error happened. Unset fields are left out of messages.
struct ErrorContext {
    std::string filePath;

    /// @brief Zero-based index of the part being processed.
    std::optional<std::uint32_t> partIndex;

    /// @brief Zero-based index of the record being processed.
    std::optional<std::uint64_t> recordIndex;

    /// @brief Offset in the framed (uncompressed) stream.
    std::optional<std::uint64_t> byteOffset;

    /// @brief Appended to messages in debug builds.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withPart(std::uint32_t index) {
        partIndex = index;
        return *this;
    }

    ErrorContext& withRecord(std::uint64_t index) {
        recordIndex = index;
        return *this;
    }

    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @return "file: ..., part: N, record: N, offset: N", empty if nothing is set.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Root of the exception hierarchy; carries the code and optional context.
class GzcException : public std::exception {
public:
    GzcException(ErrorCode code, std::string message,
                 std::optional<ErrorContext> context = std::nullopt);

    /// @brief "[category] message (context)".
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

class UsageError : public GzcException {
public:
    explicit UsageError(std::string message, std::optional<ErrorContext> context = std::nullopt)
        : GzcException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @note kFileNotFound, kFileExists, kFileOpenFailed and kInvalidState are
///       raised as IOError too.
class IOError : public GzcException {
public:
    explicit IOError(std::string message, std::optional<ErrorContext> context = std::nullopt)
        : GzcException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    IOError(ErrorCode code, std::string message, std::optional<ErrorContext> context = std::nullopt)
        : GzcException(code, std::move(message), std::move(context)) {}

    IOError(const std::string& message, std::error_code ec, ErrorContext context)
        : GzcException(ErrorCode::kIOError, withSystemError(message, ec), std::move(context)) {}

private:
    static std::string withSystemError(const std::string& message, std::error_code ec);
};

class FormatError : public GzcException {
public:
    explicit FormatError(std::string message, std::optional<ErrorContext> context = std::nullopt)
        : GzcException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}

protected:
    FormatError(ErrorCode code, std::string message, std::optional<ErrorContext> context)
        : GzcException(code, std::move(message), std::move(context)) {}
};

/// @brief The framed stream or a compressed part ended prematurely or carries
///        an impossible length marker.
class MalformedStreamError : public FormatError {
public:
    explicit MalformedStreamError(std::string message,
                                  std::optional<ErrorContext> context = std::nullopt)
        : FormatError(ErrorCode::kMalformedStream, std::move(message), std::move(context)) {}
};

/// @brief A well-framed payload failed to deserialize into its record type.
class RecordDecodeError : public FormatError {
public:
    explicit RecordDecodeError(std::string message,
                               std::optional<ErrorContext> context = std::nullopt)
        : FormatError(ErrorCode::kRecordDecodeFailed, std::move(message), std::move(context)) {}
};

class ChecksumError : public GzcException {
public:
    explicit ChecksumError(std::string message, std::optional<ErrorContext> context = std::nullopt)
        : GzcException(ErrorCode::kChecksumError, std::move(message), std::move(context)) {}
};

/// @brief zlib failure; code is kCompressionFailed or kDecompressionFailed.
class CodecError : public GzcException {
public:
    CodecError(ErrorCode code, std::string message,
               std::optional<ErrorContext> context = std::nullopt)
        : GzcException(code, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result
// =============================================================================

/// @brief Value-type error for Result; the same fields as GzcException.
class Error {
public:
    Error(ErrorCode code, std::string message, std::optional<ErrorContext> context = std::nullopt)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    explicit Error(const GzcException& ex)
        : code_(ex.code()), message_(ex.message()), context_(ex.context()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Same text as the matching exception's what().
    [[nodiscard]] std::string describe() const;

    /// @brief Throw the exception class that matches code().
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
};

template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Result of an operation with no value.
using VoidResult = Result<std::monostate>;

template <typename T>
[[nodiscard]] Result<T> makeSuccess(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::in_place};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return makeError<std::monostate>(code, std::move(message));
}

/// @brief The value of @p result, or its error thrown as the matching exception.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (!result) {
        result.error().throwException();
    }
    return std::move(*result);
}

inline void unwrapOrThrow(const VoidResult& result) {
    if (!result) {
        result.error().throwException();
    }
}

/// @brief Run @p func, turning a thrown exception into the error of a Result.
/// @note A GzcException keeps its code and context; any other std::exception
///       becomes kIOError.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const GzcException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kIOError, ex.what()});
    }
}

}  // namespace gzc

#endif  // GZC_COMMON_ERROR_H
