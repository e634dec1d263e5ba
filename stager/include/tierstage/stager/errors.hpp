#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "tierstage/error_codes.hpp"
#include "tierstage/stager/sync_types.hpp"

namespace tierstage::stager
{

    class StagingError : public std::runtime_error
    {
    public:
        StagingError(tierstage::ErrorCode code, std::string message);

        tierstage::ErrorCode code() const noexcept { return code_; }

    private:
        tierstage::ErrorCode code_;
    };

    // A copy, move or remove job exited non-zero.
    class TransferFailedError : public StagingError
    {
    public:
        TransferFailedError(std::string logical_path, int exit_code, std::string error_output);

        const std::string &logical_path() const noexcept { return logical_path_; }
        int exit_code() const noexcept { return exit_code_; }
        const std::string &error_output() const noexcept { return error_output_; }

    private:
        std::string logical_path_;
        int exit_code_;
        std::string error_output_;
    };

    // Raised by resolve once every tier has been checked and the remote copy failed.
    class NotFoundError : public StagingError
    {
    public:
        NotFoundError(std::string logical_name, std::filesystem::path remote_path, std::string error_output);

        const std::string &logical_name() const noexcept { return logical_name_; }
        const std::filesystem::path &remote_path() const noexcept { return remote_path_; }
        const std::string &error_output() const noexcept { return error_output_; }

    private:
        std::string logical_name_;
        std::filesystem::path remote_path_;
        std::string error_output_;
    };

    class ConfirmationRequiredError : public StagingError
    {
    public:
        ConfirmationRequiredError(std::string reason, SyncOutput dry_run_output);

        const SyncOutput &dry_run_output() const noexcept { return dry_run_output_; }

    private:
        SyncOutput dry_run_output_;
    };

    // The job keeps running after this is thrown.
    class TimeoutError : public StagingError
    {
    public:
        explicit TimeoutError(std::vector<std::string> command);

        const std::vector<std::string> &command() const noexcept { return command_; }

    private:
        std::vector<std::string> command_;
    };

    std::string join_command(const std::vector<std::string> &command);

} // namespace tierstage::stager
