#include "tierstage/error_codes.hpp"

#include <array>

namespace tierstage
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::TransferFailed, "transfer_failed"},
            {ErrorCode::ConfirmationRequired, "confirmation_required"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::LaunchFailed, "launch_failed"},
            {ErrorCode::WorkspaceError, "workspace_error"},
            {ErrorCode::InvalidState, "invalid_state"},
            {ErrorCode::FormatError, "format_error"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

} // namespace tierstage
