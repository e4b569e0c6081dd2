// =============================================================================
// gzchunk - Error Handling Framework Implementation
// =============================================================================

#include "gzc/common/error.h"

#include <fmt/format.h>

#include <iterator>
#include <utility>
#include <string_view>

namespace gzc {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::string out;
    auto append = [&out](std::string_view label, const auto& value) {
        fmt::format_to(std::back_inserter(out), "{}{}: {}", out.empty() ? "" : ", ", label, value);
    };

    if (!filePath.empty()) {
        append("file", filePath);
    }
    if (partIndex) {
        append("part", *partIndex);
    }
    if (recordIndex) {
        append("record", *recordIndex);
    }
    if (byteOffset) {
        append("offset", *byteOffset);
    }

#ifndef NDEBUG
    if (!out.empty()) {
        fmt::format_to(std::back_inserter(out), " (at {}:{})", location.file_name(), location.line());
    }
#endif

    return out;
}

// =============================================================================
// GzcException Implementation
// =============================================================================

namespace {

std::string formatMessage(ErrorCode code, const std::string& message,
                          const std::optional<ErrorContext>& context) {
    std::string result = fmt::format("[{}] {}", errorCodeToString(code), message);
    if (context.has_value()) {
        std::string contextStr = context->format();
        if (!contextStr.empty()) {
            result += fmt::format(" ({})", contextStr);
        }
    }
    return result;
}

}  // namespace

GzcException::GzcException(ErrorCode code, std::string message,
                           std::optional<ErrorContext> context)
    : code_(code),
      message_(std::move(message)),
      context_(std::move(context)),
      what_(formatMessage(code_, message_, context_)) {}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::withSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {}", message, ec.message());
}

// =============================================================================
// Error Implementation
// =============================================================================

std::string Error::describe() const {
    return formatMessage(code_, message_, context_);
}

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_, context_);
        case ErrorCode::kIOError:
            throw IOError(message_, context_);
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileExists:
        case ErrorCode::kFileOpenFailed:
        case ErrorCode::kInvalidState:
            throw IOError(code_, message_, context_);
        case ErrorCode::kFormatError:
            throw FormatError(message_, context_);
        case ErrorCode::kMalformedStream:
            throw MalformedStreamError(message_, context_);
        case ErrorCode::kRecordDecodeFailed:
            throw RecordDecodeError(message_, context_);
        case ErrorCode::kChecksumError:
            throw ChecksumError(message_, context_);
        case ErrorCode::kCompressionFailed:
        case ErrorCode::kDecompressionFailed:
            throw CodecError(code_, message_, context_);
        case ErrorCode::kSuccess:
            break;
    }
    throw GzcException(code_, message_, context_);
}

}  // namespace gzc
