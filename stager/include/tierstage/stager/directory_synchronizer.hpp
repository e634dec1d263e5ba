#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tierstage/logger.hpp"
#include "tierstage/stager/sync_safety_gate.hpp"
#include "tierstage/stager/sync_types.hpp"
#include "tierstage/stager/transfer_client.hpp"

namespace tierstage::stager
{

    // Mirrors the project space and the fileserver directory with the tree
    // sync command, consulting the safety gate before anything runs.
    class DirectorySynchronizer
    {
    public:
        DirectorySynchronizer(std::filesystem::path local_root, std::filesystem::path remote_root,
                              TransferClient &transfer, const SyncSafetyGate &gate, Logger logger);

        // Directory owned by a stager; never copied out of or deleted from the tier containing it.
        void exclude(std::filesystem::path owned_directory);

        SyncOutput sync(const SyncRequest &request);

        std::vector<std::string> build_options(const SyncRequest &request, bool dry_run) const;
        std::filesystem::path source_root(SyncDirection direction) const;
        std::filesystem::path destination_root(SyncDirection direction) const;

    private:
        SyncOutput run(const SyncRequest &request, bool dry_run);

        std::filesystem::path local_root_;
        std::filesystem::path remote_root_;
        TransferClient &transfer_;
        const SyncSafetyGate &gate_;
        Logger logger_;
        std::vector<std::filesystem::path> excluded_;
    };

} // namespace tierstage::stager
