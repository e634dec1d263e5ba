#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "tierstage/logger.hpp"
#include "tierstage/stager/sync_types.hpp"

namespace tierstage::stager
{

    struct SyncClassification
    {
        bool safe{true};
        bool forced_dry_run{false};
        std::string reason;
    };

    // Decides whether a directory sync may mutate data without confirmation.
    class SyncSafetyGate
    {
    public:
        using SyncRunner = std::function<SyncOutput(bool dry_run)>;

        SyncSafetyGate(std::vector<std::filesystem::path> tier_boundaries, Logger logger);

        // Dry runs are always safe. Otherwise deleting, overwriting newer
        // files, or mirroring one tier root onto another is dangerous, and a
        // dangerous unconfirmed request is forced into a dry run.
        SyncClassification classify(const SyncRequest &request, const std::filesystem::path &source_root,
                                    const std::filesystem::path &destination_root) const;

        // Runs `run_sync` for real when allowed. An unconfirmed dangerous
        // request runs it as a dry run and throws ConfirmationRequiredError
        // carrying that output.
        SyncOutput enforce(const SyncRequest &request, const std::filesystem::path &source_root,
                           const std::filesystem::path &destination_root, const SyncRunner &run_sync) const;

        // True for "/", a directory directly below "/", a configured tier
        // boundary, or a directory directly below a boundary.
        bool is_tier_root(const std::filesystem::path &path) const;

    private:
        std::vector<std::filesystem::path> boundaries_;
        Logger logger_;
    };

} // namespace tierstage::stager
