#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "tierstage/cli/options.hpp"
#include "tierstage/error_codes.hpp"
#include "tierstage/stager/errors.hpp"
#include "tierstage/stager/staging_session.hpp"
#include "tierstage/string_util.hpp"
#include "tierstage/version.hpp"

#include <spdlog/spdlog.h>

namespace
{

    using tierstage::stager::StagingSession;

    bool ask_yes_no(const std::string &question)
    {
        while (true)
        {
            std::cout << question << " (y/n): " << std::flush;
            std::string answer;
            if (!std::getline(std::cin, answer))
            {
                return false;
            }
            answer = tierstage::trim(answer);
            if (answer == "y" || answer == "Y" || answer == "yes")
            {
                return true;
            }
            if (answer == "n" || answer == "N" || answer == "no")
            {
                return false;
            }
            std::cout << "Please answer y or n." << std::endl;
        }
    }

    std::chrono::milliseconds timeout_of(const tierstage::cli::CliOptions &options,
                                         std::chrono::milliseconds fallback)
    {
        if (!options.timeout_seconds)
        {
            return fallback;
        }
        return std::chrono::seconds(*options.timeout_seconds);
    }

    tierstage::Logger make_logger(const tierstage::stager::StagerConfig &config)
    {
        tierstage::Logger logger(config.log_file, !config.quiet);
        if (auto underlying = logger.underlying())
        {
            spdlog::set_default_logger(underlying);
        }
        return logger;
    }

    int run_get(StagingSession &session, const tierstage::cli::CliOptions &options)
    {
        const auto &name = options.operands.front();
        const auto resolved = session.resolve(name, timeout_of(options, std::chrono::milliseconds{0}));

        // The cache is removed when the session ends, so copy the file out.
        auto output = options.output.value_or(resolved.filename());
        if (std::filesystem::exists(output) && std::filesystem::equivalent(output, resolved))
        {
            std::cout << resolved.string() << std::endl;
            return EXIT_SUCCESS;
        }
        std::filesystem::copy(resolved, output,
                              std::filesystem::copy_options::recursive |
                                  std::filesystem::copy_options::overwrite_existing);
        std::cout << output.string() << std::endl;
        return EXIT_SUCCESS;
    }

    int run_rm(StagingSession &session, const tierstage::cli::CliOptions &options)
    {
        const auto &name = options.operands.front();
        if (!options.wait)
        {
            auto job = session.remove(name);
            std::cout << "Remove submitted as pid " << job->pid() << std::endl;
            return EXIT_SUCCESS;
        }
        if (!session.remove_and_wait(name, timeout_of(options, std::chrono::seconds{20})))
        {
            std::cout << "Remove of " << name << " still running" << std::endl;
            return EXIT_FAILURE;
        }
        std::cout << "Removed " << name << std::endl;
        return EXIT_SUCCESS;
    }

    int run_ls(StagingSession &session, const tierstage::cli::CliOptions &options)
    {
        const auto entries = options.remote ? session.list_remote_files(options.depth) : session.list_local_files();
        for (const auto &entry : entries)
        {
            std::cout << entry << std::endl;
        }
        return EXIT_SUCCESS;
    }

    void print_sync_output(const tierstage::stager::SyncOutput &output)
    {
        std::cout << tierstage::stager::join_command(output.command) << std::endl;
        std::cout << output.out;
        if (!output.out.empty() && output.out.back() != '\n')
        {
            std::cout << std::endl;
        }
    }

    int run_sync(StagingSession &session, const tierstage::cli::CliOptions &options)
    {
        auto request = options.sync;
        request.confirmed = options.assume_yes;
        try
        {
            print_sync_output(session.sync_directories(request));
        }
        catch (const tierstage::stager::ConfirmationRequiredError &ex)
        {
            std::cout << ex.what() << std::endl;
            print_sync_output(ex.dry_run_output());
            if (!ask_yes_no("Apply these changes?"))
            {
                std::cout << "Sync cancelled" << std::endl;
                return EXIT_FAILURE;
            }
            request.confirmed = true;
            print_sync_output(session.sync_directories(request));
        }
        return EXIT_SUCCESS;
    }

} // namespace

int main(int argc, char *argv[])
{
    tierstage::cli::CliOptions options;
    try
    {
        options = tierstage::cli::parse_arguments(argc, argv);
    }
    catch (const std::exception &ex)
    {
        std::cerr << ex.what() << std::endl;
        std::cerr << tierstage::cli::usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (options.command == "version")
    {
        std::cout << "tierstage " << tierstage::version() << std::endl;
        return EXIT_SUCCESS;
    }

    try
    {
        auto config = tierstage::cli::build_config(options);
        auto logger = make_logger(config);
        StagingSession session(std::move(config), logger);

        if (options.command == "get")
        {
            return run_get(session, options);
        }
        if (options.command == "rm")
        {
            return run_rm(session, options);
        }
        if (options.command == "ls")
        {
            return run_ls(session, options);
        }
        return run_sync(session, options);
    }
    catch (const tierstage::stager::StagingError &ex)
    {
        std::cerr << "ERROR: " << tierstage::to_string(ex.code()) << std::endl;
        std::cerr << ex.what() << std::endl;
        spdlog::error("{}", ex.what());
        return EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }
}
