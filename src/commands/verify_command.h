// =============================================================================
// gzchunk - Verify Command
// =============================================================================
// Checks a stored part set without writing anything:
// - the manifest parses
// - every listed part exists with the recorded size and xxHash64 checksum
// - the whole part sequence decodes into timeline entries
// =============================================================================

#ifndef GZC_COMMANDS_VERIFY_COMMAND_H
#define GZC_COMMANDS_VERIFY_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "gzc/common/error.h"
#include "gzc/format/part_files.h"

namespace gzc::commands {

/// @brief Outcome of one check. A default-constructed result has failed.
struct CheckResult {
    std::string name;
    ErrorCode code = ErrorCode::kSuccess;
    bool passed = false;
    std::string message;
};

struct VerificationSummary {
    std::vector<CheckResult> checks;
    std::size_t totalChecks = 0;

    [[nodiscard]] std::size_t failedChecks() const noexcept;

    [[nodiscard]] bool passed() const noexcept { return failedChecks() == 0; }

    /// @brief Category of the first failed check, kSuccess if none failed.
    [[nodiscard]] ErrorCode firstFailure() const noexcept;
};

struct VerifyOptions {
    std::filesystem::path inputBase;
    bool failFast = false;
    /// @brief Print each check as it completes.
    bool verbose = false;
    bool showSummary = true;
};

class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    /// @return 0 when every check passed, otherwise the exit code of the
    ///         first failed check's category.
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

private:
    CheckResult checkManifest(std::vector<format::PartInfo>& parts);
    CheckResult checkPart(const format::PartInfo& part);
    CheckResult checkDecode(const std::vector<format::PartInfo>& parts);

    /// @return false once verification should stop.
    bool record(CheckResult result);

    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
};

}  // namespace gzc::commands

#endif  // GZC_COMMANDS_VERIFY_COMMAND_H
