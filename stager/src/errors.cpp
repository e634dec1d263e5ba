#include "tierstage/stager/errors.hpp"

#include <utility>

namespace tierstage::stager
{

    StagingError::StagingError(tierstage::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    TransferFailedError::TransferFailedError(std::string logical_path, int exit_code, std::string error_output)
        : StagingError(tierstage::ErrorCode::TransferFailed,
                       "transfer of " + logical_path + " exited with code " + std::to_string(exit_code) +
                           (error_output.empty() ? std::string{} : ": " + error_output)),
          logical_path_(std::move(logical_path)),
          exit_code_(exit_code),
          error_output_(std::move(error_output)) {}

    NotFoundError::NotFoundError(std::string logical_name, std::filesystem::path remote_path, std::string error_output)
        : StagingError(tierstage::ErrorCode::NotFound,
                       "source not found or copy failed: " + remote_path.string() +
                           (error_output.empty() ? std::string{} : " (" + error_output + ")")),
          logical_name_(std::move(logical_name)),
          remote_path_(std::move(remote_path)),
          error_output_(std::move(error_output)) {}

    ConfirmationRequiredError::ConfirmationRequiredError(std::string reason, SyncOutput dry_run_output)
        : StagingError(tierstage::ErrorCode::ConfirmationRequired,
                       "confirmation required: " + reason + ". Inspect the dry run output and repeat with confirmation."),
          dry_run_output_(std::move(dry_run_output)) {}

    TimeoutError::TimeoutError(std::vector<std::string> command)
        : StagingError(tierstage::ErrorCode::Timeout, "timed out waiting for: " + join_command(command)),
          command_(std::move(command)) {}

    std::string join_command(const std::vector<std::string> &command)
    {
        std::string joined;
        for (const auto &arg : command)
        {
            if (!joined.empty())
            {
                joined += ' ';
            }
            joined += arg;
        }
        return joined;
    }

} // namespace tierstage::stager
