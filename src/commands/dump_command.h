// =============================================================================
// gzchunk - Dump Command
// =============================================================================
// Command handler that decodes a stored timeline and prints its entries,
// as text lines or one JSON object per line.
// =============================================================================

#ifndef GZC_COMMANDS_DUMP_COMMAND_H
#define GZC_COMMANDS_DUMP_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <vector>

#include "gzc/common/error.h"

namespace gzc::commands {

/// @brief Configuration options for the dump command.
struct DumpOptions {
    /// @brief Base path of the part files.
    std::filesystem::path inputBase;

    /// @brief Maximum number of entries to print (0 = all).
    std::uint64_t limit = 0;

    /// @brief Output JSON lines.
    bool jsonOutput = false;
};

class DumpCommand {
public:
    /// @param out Destination of the entry listing.
    explicit DumpCommand(DumpOptions options, std::ostream& out);

    ~DumpCommand();

    DumpCommand(const DumpCommand&) = delete;
    DumpCommand& operator=(const DumpCommand&) = delete;

    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Number of entries printed by the last execute().
    [[nodiscard]] std::uint64_t entriesPrinted() const noexcept { return entriesPrinted_; }

    [[nodiscard]] const DumpOptions& options() const noexcept { return options_; }

private:
    DumpOptions options_;
    std::ostream* out_;
    std::uint64_t entriesPrinted_ = 0;
};

/// @brief Paths of the parts stored under base: the manifest's list when a
///        manifest exists, otherwise the consecutive "<base>.N" files.
[[nodiscard]] std::vector<std::filesystem::path> locateParts(const std::filesystem::path& base);

}  // namespace gzc::commands

#endif  // GZC_COMMANDS_DUMP_COMMAND_H
