#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tierstage::stager
{

    enum class SyncDirection
    {
        ToRemote,
        FromRemote
    };

    std::string_view to_string(SyncDirection direction) noexcept;

    struct SyncRequest
    {
        SyncDirection direction{SyncDirection::FromRemote};
        bool delete_extraneous{};
        bool overwrite_newer{};
        bool dry_run{};
        bool confirmed{};
    };

    struct SyncOutput
    {
        std::vector<std::string> command;
        int exit_code{};
        std::string out;
        std::string err;
        bool dry_run{};
    };

} // namespace tierstage::stager
