#include "tierstage/stager/workspace.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

#include "tierstage/stager/errors.hpp"
#include "tierstage/string_util.hpp"

namespace tierstage::stager
{

    namespace
    {

        std::string last_non_empty_line(const std::string &text)
        {
            std::istringstream stream(text);
            std::string line;
            std::string last;
            while (std::getline(stream, line))
            {
                auto trimmed = trim(line);
                if (!trimmed.empty())
                {
                    last = std::move(trimmed);
                }
            }
            return last;
        }

        bool reports_missing(std::string text)
        {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            return text.find("does not exist") != std::string::npos || text.find("not found") != std::string::npos ||
                   text.find("no such") != std::string::npos;
        }

    } // namespace

    WorkspaceAllocator::WorkspaceAllocator(WorkspaceConfig config, CommandRunner &runner, Logger logger)
        : config_(std::move(config)), runner_(runner), logger_(std::move(logger)) {}

    Workspace WorkspaceAllocator::allocate(int expire_in_days)
    {
        if (expire_in_days <= 0)
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "Workspace expiry must be at least one day");
        }

        auto job = runner_.launch(allocate_command(expire_in_days));
        const auto exit_code = runner_.wait(*job);
        auto output = runner_.drain(*job);
        if (!exit_code || *exit_code != 0)
        {
            throw StagingError(tierstage::ErrorCode::WorkspaceError,
                               "Allocating workspace " + config_.name + " failed: " + trim(output.err));
        }

        // The tool prints the workspace path as the last line of stdout.
        const auto path = last_non_empty_line(output.out);
        if (path.empty())
        {
            throw StagingError(tierstage::ErrorCode::WorkspaceError,
                               "Workspace tool did not report a path for " + config_.name);
        }

        logger_.log("workspace", "allocated ", config_.name, " at ", path, " for ", expire_in_days, " days");
        return Workspace{.name = config_.name, .path = std::filesystem::path(path)};
    }

    void WorkspaceAllocator::release(const std::string &name)
    {
        auto job = runner_.launch(release_command(name));
        const auto exit_code = runner_.wait(*job);
        auto output = runner_.drain(*job);
        if (exit_code && *exit_code == 0)
        {
            logger_.log("workspace", "released ", name);
            return;
        }
        if (reports_missing(output.err) || reports_missing(output.out))
        {
            logger_.warn("workspace", name, " was already released");
            return;
        }
        throw StagingError(tierstage::ErrorCode::WorkspaceError,
                           "Releasing workspace " + name + " failed: " + trim(output.err));
    }

    std::vector<std::string> WorkspaceAllocator::allocate_command(int expire_in_days) const
    {
        std::vector<std::string> command{executable(config_.allocate_command)};
        if (config_.filesystem)
        {
            command.emplace_back("-F");
            command.push_back(*config_.filesystem);
        }
        command.push_back(config_.name);
        command.push_back(std::to_string(expire_in_days));
        return command;
    }

    std::vector<std::string> WorkspaceAllocator::release_command(const std::string &name) const
    {
        std::vector<std::string> command{executable(config_.release_command)};
        if (config_.filesystem)
        {
            command.emplace_back("-F");
            command.push_back(*config_.filesystem);
        }
        command.push_back(name);
        return command;
    }

    std::string WorkspaceAllocator::executable(const std::string &name) const
    {
        if (config_.bin_dir.empty())
        {
            return name;
        }
        return (config_.bin_dir / name).string();
    }

} // namespace tierstage::stager
