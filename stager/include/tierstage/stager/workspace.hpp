#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "tierstage/logger.hpp"
#include "tierstage/stager/command_runner.hpp"
#include "tierstage/stager/config.hpp"

namespace tierstage::stager
{

    struct Workspace
    {
        std::string name;
        std::filesystem::path path;
    };

    // Client for the cluster's workspace tools (ws_allocate / ws_release).
    class WorkspaceAllocator
    {
    public:
        WorkspaceAllocator(WorkspaceConfig config, CommandRunner &runner, Logger logger);

        // Creates the configured workspace or reuses it when it already exists.
        Workspace allocate(int expire_in_days);
        Workspace allocate() { return allocate(config_.expire_days); }

        // Releasing a workspace that no longer exists succeeds.
        void release(const std::string &name);

        std::vector<std::string> allocate_command(int expire_in_days) const;
        std::vector<std::string> release_command(const std::string &name) const;

    private:
        std::string executable(const std::string &name) const;

        WorkspaceConfig config_;
        CommandRunner &runner_;
        Logger logger_;
    };

} // namespace tierstage::stager
