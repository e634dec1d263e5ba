#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tierstage::stager
{

    // Batch transfer commands available on the export nodes.
    struct TransferToolConfig
    {
        std::filesystem::path bin_dir{"/sw/taurus/tools/slurmtools/default/bin"};
        std::string copy_command{"dtcp"};
        std::string remove_command{"dtrm"};
        std::string list_command{"dtls"};
        std::string move_command{"dtmv"};
        std::string tree_sync_command{"dtrsync"};
    };

    // Cache workspace allocation. When cache_root is set no workspace is
    // allocated and the cache lives below that directory instead.
    struct WorkspaceConfig
    {
        std::filesystem::path bin_dir{"/usr/bin"};
        std::string allocate_command{"ws_allocate"};
        std::string release_command{"ws_release"};
        std::string name{"tierstage_cache"};
        int expire_days{10};
        std::optional<std::string> filesystem;
        std::optional<std::filesystem::path> cache_root;
    };

    struct StagerConfig
    {
        std::filesystem::path remote_root;
        std::filesystem::path local_root;
        TransferToolConfig transfer;
        WorkspaceConfig workspace;
        std::vector<std::filesystem::path> tier_boundaries;
        std::chrono::milliseconds poll_interval{std::chrono::milliseconds{50}};
        std::optional<std::filesystem::path> log_file;
        bool quiet{false};
    };

    StagerConfig load_config(const std::filesystem::path &path);

    void validate(const StagerConfig &config);

} // namespace tierstage::stager
