// =============================================================================
// gzchunk - Dump Command Implementation
// =============================================================================

#include "dump_command.h"

#include <ostream>
#include <utility>

#include "gzc/common/logger.h"
#include "gzc/format/gzchunked.h"
#include "gzc/format/part_files.h"
#include "gzc/timeline/timeline_entry.h"

namespace gzc::commands {

std::vector<std::filesystem::path> locateParts(const std::filesystem::path& base) {
    std::error_code ec;
    if (std::filesystem::exists(format::manifestPath(base), ec)) {
        std::vector<std::filesystem::path> paths;
        for (auto& info : format::readManifest(base)) {
            paths.push_back(std::move(info.path));
        }
        return paths;
    }

    auto paths = format::discoverParts(base);
    if (paths.empty()) {
        throw IOError(ErrorCode::kFileNotFound,
                      "No manifest or parts found for " + base.string(),
                      ErrorContext(base.string()));
    }
    GZC_LOG_WARNING("No manifest for {}, decoding {} discovered parts", base.string(),
                    paths.size());
    return paths;
}

// =============================================================================
// DumpCommand Implementation
// =============================================================================

DumpCommand::DumpCommand(DumpOptions options, std::ostream& out)
    : options_(std::move(options)), out_(&out) {}

DumpCommand::~DumpCommand() = default;

int DumpCommand::execute() {
    entriesPrinted_ = 0;
    try {
        const auto paths = locateParts(options_.inputBase);
        GZC_LOG_DEBUG("Decoding {} parts of {}", paths.size(), options_.inputBase.string());

        format::GzChunkedDecoder<timeline::TimelineEntry> decoder(format::openParts(paths));

        while (options_.limit == 0 || entriesPrinted_ < options_.limit) {
            auto entry = decoder.next();
            if (!entry) {
                entry.error().throwException();
            }
            if (!entry->has_value()) {
                break;
            }

            const auto& value = **entry;
            *out_ << (options_.jsonOutput ? timeline::formatEntryJson(value)
                                          : timeline::formatEntry(value))
                  << '\n';
            ++entriesPrinted_;
        }
        out_->flush();

        if (!out_->good()) {
            throw IOError("Failed to write entry listing");
        }
        return 0;

    } catch (const GzcException& e) {
        GZC_LOG_ERROR("Dump failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        GZC_LOG_ERROR("Unexpected error: {}", e.what());
        return 1;
    }
}

}  // namespace gzc::commands
