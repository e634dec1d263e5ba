#include "tierstage/stager/transfer_client.hpp"

#include <utility>

namespace tierstage::stager
{

    TransferClient::TransferClient(TransferToolConfig config, CommandRunner &runner, Logger logger)
        : config_(std::move(config)), runner_(runner), logger_(std::move(logger)) {}

    JobHandle TransferClient::copy(bool recursive, const std::string &source, const std::string &destination)
    {
        logger_.debug("transfer", "copy ", source, " -> ", destination);
        return runner_.launch(copy_command(recursive, source, destination));
    }

    JobHandle TransferClient::remove(bool recursive, const std::string &path)
    {
        logger_.debug("transfer", "remove ", path);
        return runner_.launch(remove_command(recursive, path));
    }

    JobHandle TransferClient::list(const std::string &path, int recurse_depth)
    {
        logger_.debug("transfer", "list ", path);
        return runner_.launch(list_command(path, recurse_depth));
    }

    JobHandle TransferClient::move(const std::string &source, const std::string &destination)
    {
        logger_.debug("transfer", "move ", source, " -> ", destination);
        return runner_.launch(move_command(source, destination));
    }

    JobHandle TransferClient::tree_sync(const std::vector<std::string> &options, const std::string &source,
                                        const std::string &destination)
    {
        logger_.debug("transfer", "tree sync ", source, " -> ", destination);
        return runner_.launch(tree_sync_command(options, source, destination));
    }

    std::vector<std::string> TransferClient::copy_command(bool recursive, const std::string &source,
                                                          const std::string &destination) const
    {
        std::vector<std::string> command{executable(config_.copy_command)};
        if (recursive)
        {
            command.emplace_back("-r");
        }
        command.push_back(source);
        command.push_back(destination);
        return command;
    }

    std::vector<std::string> TransferClient::remove_command(bool recursive, const std::string &path) const
    {
        std::vector<std::string> command{executable(config_.remove_command)};
        if (recursive)
        {
            command.emplace_back("-r");
        }
        command.push_back(path);
        return command;
    }

    std::vector<std::string> TransferClient::list_command(const std::string &path, int recurse_depth) const
    {
        std::vector<std::string> command{executable(config_.list_command)};
        command.emplace_back(recurse_depth == 0 ? "-1" : "-R1");
        command.push_back(path);
        return command;
    }

    std::vector<std::string> TransferClient::move_command(const std::string &source,
                                                          const std::string &destination) const
    {
        return {executable(config_.move_command), source, destination};
    }

    std::vector<std::string> TransferClient::tree_sync_command(const std::vector<std::string> &options,
                                                               const std::string &source,
                                                               const std::string &destination) const
    {
        std::vector<std::string> command{executable(config_.tree_sync_command)};
        command.insert(command.end(), options.begin(), options.end());
        command.push_back(source);
        command.push_back(destination);
        return command;
    }

    std::string TransferClient::executable(const std::string &name) const
    {
        if (config_.bin_dir.empty())
        {
            return name;
        }
        return (config_.bin_dir / name).string();
    }

} // namespace tierstage::stager
