#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tierstage/stager/config.hpp"
#include "tierstage/stager/sync_types.hpp"

namespace tierstage::cli
{

    struct CliOptions
    {
        std::optional<std::filesystem::path> config_path;
        std::optional<std::filesystem::path> remote_root;
        std::optional<std::filesystem::path> local_root;
        std::optional<std::filesystem::path> cache_root;
        std::optional<std::filesystem::path> log_path;
        bool quiet{false};

        std::string command;
        std::vector<std::string> operands;

        std::optional<std::filesystem::path> output;
        std::optional<std::int64_t> timeout_seconds;
        bool wait{false};
        bool remote{false};
        int depth{-1};
        tierstage::stager::SyncRequest sync;
        bool assume_yes{false};
    };

    std::string usage(const std::string &program_name);

    CliOptions parse_arguments(int argc, char *argv[]);

    // Config file values overridden by command-line options.
    tierstage::stager::StagerConfig build_config(const CliOptions &options);

} // namespace tierstage::cli
