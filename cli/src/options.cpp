#include "tierstage/cli/options.hpp"

#include <set>
#include <stdexcept>

namespace tierstage::cli
{

    namespace
    {

        const std::set<std::string> kCommands{"get", "rm", "ls", "sync", "version"};

        std::string require_value(int &index, int argc, char *argv[], const std::string &option)
        {
            if (index >= argc)
            {
                throw std::runtime_error(option + " requires a value");
            }
            return argv[index++];
        }

    } // namespace

    std::string usage(const std::string &program_name)
    {
        return "Usage: " + program_name +
               " [--config <file>] [--remote-root <dir>] [--local-root <dir>] [--cache-root <dir>]"
               " [--log <file>] [--quiet] <command> [options]\n"
               "Commands:\n"
               "  get <name> [--output <path>] [--timeout <seconds>]\n"
               "  rm <name> [--wait] [--timeout <seconds>]\n"
               "  ls [--remote] [--depth <n>]\n"
               "  sync [--to-remote | --from-remote] [--delete] [--overwrite-newer] [--dry-run] [--yes]\n"
               "  version\n";
    }

    CliOptions parse_arguments(int argc, char *argv[])
    {
        CliOptions options;
        int index = 1;

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--config")
            {
                options.config_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--remote-root")
            {
                options.remote_root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--local-root")
            {
                options.local_root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--cache-root")
            {
                options.cache_root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--log")
            {
                options.log_path = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--quiet")
            {
                options.quiet = true;
            }
            else if (arg == "--output")
            {
                options.output = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--timeout")
            {
                options.timeout_seconds = std::stoll(require_value(index, argc, argv, arg));
            }
            else if (arg == "--wait")
            {
                options.wait = true;
            }
            else if (arg == "--remote")
            {
                options.remote = true;
            }
            else if (arg == "--depth")
            {
                options.depth = std::stoi(require_value(index, argc, argv, arg));
            }
            else if (arg == "--to-remote")
            {
                options.sync.direction = tierstage::stager::SyncDirection::ToRemote;
            }
            else if (arg == "--from-remote")
            {
                options.sync.direction = tierstage::stager::SyncDirection::FromRemote;
            }
            else if (arg == "--delete")
            {
                options.sync.delete_extraneous = true;
            }
            else if (arg == "--overwrite-newer")
            {
                options.sync.overwrite_newer = true;
            }
            else if (arg == "--dry-run")
            {
                options.sync.dry_run = true;
            }
            else if (arg == "--yes")
            {
                options.assume_yes = true;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (options.command.empty())
            {
                if (kCommands.find(arg) == kCommands.end())
                {
                    throw std::runtime_error("Unknown command: " + arg);
                }
                options.command = arg;
            }
            else
            {
                options.operands.push_back(arg);
            }
        }

        if (options.command.empty())
        {
            throw std::runtime_error("Missing command");
        }
        if ((options.command == "get" || options.command == "rm") && options.operands.size() != 1)
        {
            throw std::runtime_error(options.command + " expects exactly one file name");
        }
        if ((options.command == "ls" || options.command == "sync" || options.command == "version") &&
            !options.operands.empty())
        {
            throw std::runtime_error(options.command + " takes no file names");
        }
        if (options.timeout_seconds && *options.timeout_seconds < 0)
        {
            throw std::runtime_error("--timeout must not be negative");
        }
        return options;
    }

    tierstage::stager::StagerConfig build_config(const CliOptions &options)
    {
        tierstage::stager::StagerConfig config;
        if (options.config_path)
        {
            config = tierstage::stager::load_config(*options.config_path);
        }
        if (options.remote_root)
        {
            config.remote_root = *options.remote_root;
        }
        if (options.local_root)
        {
            config.local_root = *options.local_root;
        }
        if (options.cache_root)
        {
            config.workspace.cache_root = *options.cache_root;
        }
        if (options.log_path)
        {
            config.log_file = *options.log_path;
        }
        if (options.quiet)
        {
            config.quiet = true;
        }
        tierstage::stager::validate(config);
        return config;
    }

} // namespace tierstage::cli
