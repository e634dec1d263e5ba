#pragma once

#include <string>
#include <vector>

#include "tierstage/logger.hpp"
#include "tierstage/stager/command_runner.hpp"
#include "tierstage/stager/config.hpp"

namespace tierstage::stager
{

    // Argument assembly for the batch transfer commands. Exit codes are
    // returned to the caller through the job and never interpreted here.
    class TransferClient
    {
    public:
        TransferClient(TransferToolConfig config, CommandRunner &runner, Logger logger);

        JobHandle copy(bool recursive, const std::string &source, const std::string &destination);
        JobHandle remove(bool recursive, const std::string &path);
        // A negative depth lists recursively, zero lists only `path` itself.
        JobHandle list(const std::string &path, int recurse_depth);
        JobHandle move(const std::string &source, const std::string &destination);
        JobHandle tree_sync(const std::vector<std::string> &options, const std::string &source,
                            const std::string &destination);

        std::vector<std::string> copy_command(bool recursive, const std::string &source,
                                              const std::string &destination) const;
        std::vector<std::string> remove_command(bool recursive, const std::string &path) const;
        std::vector<std::string> list_command(const std::string &path, int recurse_depth) const;
        std::vector<std::string> move_command(const std::string &source, const std::string &destination) const;
        std::vector<std::string> tree_sync_command(const std::vector<std::string> &options, const std::string &source,
                                                   const std::string &destination) const;

        CommandRunner &runner() noexcept { return runner_; }

    private:
        std::string executable(const std::string &name) const;

        TransferToolConfig config_;
        CommandRunner &runner_;
        Logger logger_;
    };

} // namespace tierstage::stager
