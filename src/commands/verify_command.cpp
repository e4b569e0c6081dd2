// =============================================================================
// gzchunk - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <algorithm>
#include <cstdio>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "gzc/common/logger.h"
#include "gzc/format/gzchunked.h"
#include "gzc/timeline/timeline_entry.h"

namespace gzc::commands {

namespace {

constexpr const char* kDecodeCheck = "Stream Decode";

CheckResult pass(std::string name, std::string message) {
    return CheckResult{std::move(name), ErrorCode::kSuccess, true, std::move(message)};
}

CheckResult fail(std::string name, ErrorCode code, std::string message) {
    return CheckResult{std::move(name), code, false, std::move(message)};
}

CheckResult fail(std::string name, const Error& error) {
    return fail(std::move(name), error.code(), error.describe());
}

}  // namespace

std::size_t VerificationSummary::failedChecks() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        checks.begin(), checks.end(), [](const CheckResult& check) { return !check.passed; }));
}

ErrorCode VerificationSummary::firstFailure() const noexcept {
    auto it = std::find_if(checks.begin(), checks.end(),
                           [](const CheckResult& check) { return !check.passed; });
    return it == checks.end() ? ErrorCode::kSuccess : it->code;
}

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

int VerifyCommand::execute() {
    try {
        GZC_LOG_DEBUG("Verifying part set {}", options_.inputBase.string());

        std::vector<format::PartInfo> parts;
        bool keepGoing = record(checkManifest(parts));

        // A set with a damaged part is not worth decoding.
        bool intact = keepGoing;
        for (std::size_t i = 0; keepGoing && i < parts.size(); ++i) {
            auto result = checkPart(parts[i]);
            intact = intact && result.passed;
            keepGoing = record(std::move(result));
        }

        if (keepGoing && intact) {
            record(checkDecode(parts));
        }

        if (options_.showSummary) {
            printSummary();
        }
        return toExitCode(summary_.firstFailure());

    } catch (const GzcException& e) {
        GZC_LOG_ERROR("Verification failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        GZC_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

bool VerifyCommand::record(CheckResult result) {
    if (options_.verbose) {
        fmt::print("[{}] {}: {}\n", result.passed ? "PASS" : "FAIL", result.name, result.message);
    }
    if (!result.passed) {
        GZC_LOG_WARNING("Check '{}' failed: {}", result.name, result.message);
    }

    const bool keepGoing = result.passed || !options_.failFast;
    summary_.checks.push_back(std::move(result));
    ++summary_.totalChecks;
    return keepGoing;
}

CheckResult VerifyCommand::checkManifest(std::vector<format::PartInfo>& parts) {
    auto manifest = tryExecute([this]() { return format::readManifest(options_.inputBase); });
    if (!manifest) {
        return fail("Manifest", manifest.error());
    }
    parts = std::move(*manifest);
    return pass("Manifest", fmt::format("{} parts listed", parts.size()));
}

CheckResult VerifyCommand::checkPart(const format::PartInfo& part) {
    auto name = fmt::format("Part {}", part.index);

    std::error_code ec;
    const auto size = std::filesystem::file_size(part.path, ec);
    if (ec) {
        return fail(std::move(name), ErrorCode::kFileNotFound,
                    fmt::format("{}: {}", part.path.string(), ec.message()));
    }
    if (size != part.size) {
        return fail(std::move(name), ErrorCode::kChecksumError,
                    fmt::format("size is {} bytes, manifest says {}", size, part.size));
    }

    auto checksum = tryExecute([&part]() { return format::fileChecksum(part.path); });
    if (!checksum) {
        return fail(std::move(name), checksum.error());
    }
    if (*checksum != part.checksum) {
        return fail(std::move(name), ErrorCode::kChecksumError,
                    fmt::format("xxh64 is {:016x}, manifest says {:016x}", *checksum,
                                part.checksum));
    }
    return pass(std::move(name), fmt::format("{} bytes, xxh64 {:016x}", size, *checksum));
}

CheckResult VerifyCommand::checkDecode(const std::vector<format::PartInfo>& parts) {
    std::vector<std::filesystem::path> paths;
    paths.reserve(parts.size());
    for (const auto& part : parts) {
        paths.push_back(part.path);
    }

    auto sources = tryExecute([&paths]() { return format::openParts(paths); });
    if (!sources) {
        return fail(kDecodeCheck, sources.error());
    }

    format::GzChunkedDecoder<timeline::TimelineEntry> decoder(std::move(*sources));
    for (;;) {
        auto entry = decoder.next();
        if (!entry) {
            return fail(kDecodeCheck, entry.error());
        }
        if (!entry->has_value()) {
            break;
        }
    }
    return pass(kDecodeCheck, fmt::format("{} entries in {} framed bytes",
                                          decoder.recordsDecoded(), decoder.bytesConsumed()));
}

void VerifyCommand::printSummary() const {
    const auto failed = summary_.failedChecks();
    fmt::print("{}: {}/{} checks passed, {}\n", options_.inputBase.string(),
               summary_.totalChecks - failed, summary_.totalChecks, failed == 0 ? "OK" : "FAILED");
    for (const auto& check : summary_.checks) {
        if (!check.passed) {
            fmt::print("  {}: {}\n", check.name, check.message);
        }
    }
    std::fflush(stdout);
}

}  // namespace gzc::commands
