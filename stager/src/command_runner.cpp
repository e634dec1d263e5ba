#include "tierstage/stager/command_runner.hpp"

#include <asio/buffer.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <memory>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "tierstage/stager/errors.hpp"

namespace tierstage::stager
{

    namespace
    {

        std::string errno_message(int error)
        {
            return std::string(std::strerror(error));
        }

        class Pipe
        {
        public:
            Pipe()
            {
                int fds[2];
                if (::pipe2(fds, O_CLOEXEC) != 0)
                {
                    throw StagingError(tierstage::ErrorCode::LaunchFailed, "pipe2 failed: " + errno_message(errno));
                }
                read_ = fds[0];
                write_ = fds[1];
            }

            Pipe(const Pipe &) = delete;
            Pipe &operator=(const Pipe &) = delete;

            ~Pipe()
            {
                close_read();
                close_write();
            }

            int read_end() const noexcept { return read_; }
            int write_end() const noexcept { return write_; }

            void close_read() noexcept
            {
                if (read_ >= 0)
                {
                    ::close(read_);
                    read_ = -1;
                }
            }

            void close_write() noexcept
            {
                if (write_ >= 0)
                {
                    ::close(write_);
                    write_ = -1;
                }
            }

            int release_read() noexcept
            {
                const int fd = read_;
                read_ = -1;
                return fd;
            }

        private:
            int read_{-1};
            int write_{-1};
        };

        int decode_status(int status)
        {
            if (WIFEXITED(status))
            {
                return WEXITSTATUS(status);
            }
            if (WIFSIGNALED(status))
            {
                return 128 + WTERMSIG(status);
            }
            return 1;
        }

    } // namespace

    TransferJob::TransferJob(LaunchKey, std::vector<std::string> command, pid_t pid, int stdout_fd,
                             int stderr_fd)
        : command_(std::move(command)),
          pid_(pid),
          io_context_(1),
          stdout_stream_(io_context_, stdout_fd),
          stderr_stream_(io_context_, stderr_fd)
    {
        start_read(stdout_stream_, stdout_buffer_, stdout_data_, stdout_open_);
        start_read(stderr_stream_, stderr_buffer_, stderr_data_, stderr_open_);
    }

    TransferJob::~TransferJob()
    {
        if (state_ == JobState::Running)
        {
            // Abandoned jobs are not killed; reap if it already finished.
            int status = 0;
            ::waitpid(pid_, &status, WNOHANG);
        }
        std::error_code ignored;
        stdout_stream_.close(ignored);
        stderr_stream_.close(ignored);
    }

    void TransferJob::start_read(asio::posix::stream_descriptor &stream, std::array<char, 4096> &buffer,
                                 std::string &sink, bool &open)
    {
        stream.async_read_some(asio::buffer(buffer), [this, &stream, &buffer, &sink, &open](const std::error_code &ec,
                                                                                          std::size_t bytes)
                               {
            if (bytes > 0)
            {
                sink.append(buffer.data(), bytes);
            }
            if (ec)
            {
                open = false;
                std::error_code ignored;
                stream.close(ignored);
                return;
            }
            start_read(stream, buffer, sink, open); });
    }

    CommandRunner::CommandRunner(Logger logger, std::chrono::milliseconds poll_interval)
        : logger_(std::move(logger)),
          poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds{50}) {}

    JobHandle CommandRunner::launch(std::vector<std::string> command)
    {
        if (command.empty() || command.front().empty())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "Cannot launch an empty command");
        }

        std::vector<char *> argv;
        argv.reserve(command.size() + 1);
        for (auto &arg : command)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        Pipe out;
        Pipe err;
        Pipe exec_status;

        const pid_t pid = ::fork();
        if (pid < 0)
        {
            throw StagingError(tierstage::ErrorCode::LaunchFailed, "fork failed: " + errno_message(errno));
        }
        if (pid == 0)
        {
            const int null_fd = ::open("/dev/null", O_RDONLY);
            if (null_fd >= 0)
            {
                ::dup2(null_fd, STDIN_FILENO);
            }
            ::dup2(out.write_end(), STDOUT_FILENO);
            ::dup2(err.write_end(), STDERR_FILENO);
            ::execvp(argv[0], argv.data());
            const int exec_errno = errno;
            [[maybe_unused]] const auto written = ::write(exec_status.write_end(), &exec_errno, sizeof(exec_errno));
            ::_exit(127);
        }

        out.close_write();
        err.close_write();
        exec_status.close_write();

        // The status pipe is close-on-exec: EOF means exec succeeded.
        int exec_errno = 0;
        ssize_t received = 0;
        do
        {
            received = ::read(exec_status.read_end(), &exec_errno, sizeof(exec_errno));
        } while (received < 0 && errno == EINTR);

        if (received > 0)
        {
            int status = 0;
            ::waitpid(pid, &status, 0);
            logger_.error("runner", "cannot execute ", command.front(), ": ", errno_message(exec_errno));
            throw StagingError(tierstage::ErrorCode::LaunchFailed,
                               "Cannot execute " + command.front() + ": " + errno_message(exec_errno));
        }

        ++jobs_launched_;
        logger_.log("runner", "pid ", pid, " started: ", join_command(command));
        return std::make_unique<TransferJob>(TransferJob::LaunchKey{}, std::move(command), pid, out.release_read(),
                                             err.release_read());
    }

    std::optional<int> CommandRunner::poll(TransferJob &job) const
    {
        if (job.state_ == JobState::Done)
        {
            return job.exit_code_;
        }
        pump(job);
        if (!reap(job))
        {
            return std::nullopt;
        }
        // Collect whatever the process left in its pipes before exiting.
        pump(job);
        return job.exit_code_;
    }

    std::optional<int> CommandRunner::wait(TransferJob &job, std::chrono::milliseconds timeout) const
    {
        using clock = std::chrono::steady_clock;
        const auto start = clock::now();
        const bool bounded = timeout.count() > 0;

        while (true)
        {
            if (auto code = poll(job))
            {
                return code;
            }

            auto slice = poll_interval_;
            if (bounded)
            {
                const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
                if (elapsed >= timeout)
                {
                    logger_.warn("runner", "pid ", job.pid_, " still running after ", timeout.count(), " ms");
                    return std::nullopt;
                }
                slice = std::max(std::chrono::milliseconds{1}, std::min(slice, timeout - elapsed));
            }

            if (job.streams_open())
            {
                job.io_context_.restart();
                job.io_context_.run_for(slice);
            }
            else
            {
                std::this_thread::sleep_for(slice);
            }
        }
    }

    JobOutput CommandRunner::drain(TransferJob &job) const
    {
        if (job.state_ != JobState::Done)
        {
            throw StagingError(tierstage::ErrorCode::InvalidState,
                               "Output requested before the job finished: " + join_command(job.command_));
        }
        if (job.drained_)
        {
            throw StagingError(tierstage::ErrorCode::InvalidState,
                               "Output already drained: " + join_command(job.command_));
        }
        job.drained_ = true;
        return JobOutput{.out = std::move(job.stdout_data_), .err = std::move(job.stderr_data_)};
    }

    void CommandRunner::pump(TransferJob &job) const
    {
        if (!job.streams_open())
        {
            return;
        }
        job.io_context_.restart();
        while (job.io_context_.poll() > 0)
        {
        }
    }

    bool CommandRunner::reap(TransferJob &job) const
    {
        int status = 0;
        pid_t result = 0;
        do
        {
            result = ::waitpid(job.pid_, &status, WNOHANG);
        } while (result < 0 && errno == EINTR);

        if (result == 0)
        {
            return false;
        }
        if (result < 0)
        {
            throw StagingError(tierstage::ErrorCode::InternalError,
                               "waitpid failed for pid " + std::to_string(job.pid_) + ": " + errno_message(errno));
        }

        job.exit_code_ = decode_status(status);
        job.state_ = JobState::Done;
        logger_.debug("runner", "pid ", job.pid_, " exited with ", *job.exit_code_);
        return true;
    }

} // namespace tierstage::stager
