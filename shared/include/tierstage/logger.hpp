#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace tierstage
{

    // Tagged logger shared by value between components. Without a file path
    // and with the console disabled every message goes to a null sink.
    class Logger
    {
    public:
        Logger();
        Logger(const std::optional<std::filesystem::path> &path, bool console);

        template <typename... Args>
        void log(const std::string &tag, Args &&...args) const
        {
            write(spdlog::level::info, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void debug(const std::string &tag, Args &&...args) const
        {
            write(spdlog::level::debug, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(const std::string &tag, Args &&...args) const
        {
            write(spdlog::level::warn, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(const std::string &tag, Args &&...args) const
        {
            write(spdlog::level::err, tag, std::forward<Args>(args)...);
        }

        void set_level(spdlog::level::level_enum level);

        std::shared_ptr<spdlog::logger> underlying() const { return logger_; }

    private:
        template <typename... Args>
        void write(spdlog::level::level_enum level, const std::string &tag, Args &&...args) const
        {
            if (!logger_ || !logger_->should_log(level))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->log(level, "[{}] {}", tag, std::string(buf.data(), buf.size()));
        }

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace tierstage
