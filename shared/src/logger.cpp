#include "tierstage/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace tierstage
{

    Logger::Logger() : Logger(std::nullopt, false) {}

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool console)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (console)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), false));
            }
            if (sinks.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("tierstage", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
            logger_->set_level(spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

    void Logger::set_level(spdlog::level::level_enum level)
    {
        if (logger_)
        {
            logger_->set_level(level);
        }
    }

} // namespace tierstage
