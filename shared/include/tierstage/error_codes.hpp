/**
 * tierstage - Error codes shared by the stager library and the command-line tool.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace tierstage
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        NotFound = 2,
        TransferFailed = 3,
        ConfirmationRequired = 4,
        Timeout = 5,
        LaunchFailed = 6,
        WorkspaceError = 7,
        InvalidState = 8,
        FormatError = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

} // namespace tierstage
