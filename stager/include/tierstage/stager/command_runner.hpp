#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include "tierstage/logger.hpp"

namespace tierstage::stager
{

    enum class JobState
    {
        Running,
        Done
    };

    struct JobOutput
    {
        std::string out;
        std::string err;
    };

    class CommandRunner;

    // One external command started by CommandRunner. Output is collected in
    // the background while the runner waits on it and handed out once by drain().
    class TransferJob
    {
        // Only CommandRunner can construct jobs.
        class LaunchKey
        {
            friend class CommandRunner;
            LaunchKey() = default;
        };

    public:
        TransferJob(LaunchKey, std::vector<std::string> command, pid_t pid, int stdout_fd, int stderr_fd);
        TransferJob(const TransferJob &) = delete;
        TransferJob &operator=(const TransferJob &) = delete;
        ~TransferJob();

        const std::vector<std::string> &command() const noexcept { return command_; }
        pid_t pid() const noexcept { return pid_; }
        JobState state() const noexcept { return state_; }
        std::optional<int> exit_code() const noexcept { return exit_code_; }
        bool drained() const noexcept { return drained_; }

    private:
        friend class CommandRunner;

        void start_read(asio::posix::stream_descriptor &stream, std::array<char, 4096> &buffer, std::string &sink,
                        bool &open);
        bool streams_open() const noexcept { return stdout_open_ || stderr_open_; }

        std::vector<std::string> command_;
        pid_t pid_;
        asio::io_context io_context_;
        asio::posix::stream_descriptor stdout_stream_;
        asio::posix::stream_descriptor stderr_stream_;
        std::array<char, 4096> stdout_buffer_{};
        std::array<char, 4096> stderr_buffer_{};
        std::string stdout_data_;
        std::string stderr_data_;
        bool stdout_open_{true};
        bool stderr_open_{true};
        JobState state_{JobState::Running};
        std::optional<int> exit_code_;
        bool drained_{false};
    };

    using JobHandle = std::unique_ptr<TransferJob>;

    class CommandRunner
    {
    public:
        explicit CommandRunner(Logger logger, std::chrono::milliseconds poll_interval = std::chrono::milliseconds{50});

        // Starts `command` without blocking. command[0] is looked up on PATH
        // unless it contains a slash.
        JobHandle launch(std::vector<std::string> command);

        // Exit code if the job has finished, nullopt while it is running.
        std::optional<int> poll(TransferJob &job) const;

        // Blocks until the job finishes. A non-positive timeout waits forever;
        // on timeout nullopt is returned and the process keeps running.
        std::optional<int> wait(TransferJob &job,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) const;

        // Hands out the captured stdout/stderr. Valid once per finished job.
        JobOutput drain(TransferJob &job) const;

        std::size_t jobs_launched() const noexcept { return jobs_launched_; }

    private:
        void pump(TransferJob &job) const;
        bool reap(TransferJob &job) const;

        Logger logger_;
        std::chrono::milliseconds poll_interval_;
        std::size_t jobs_launched_{0};
    };

} // namespace tierstage::stager
