#include "tierstage/stager/config.hpp"

#include <fstream>

#include <nlohmann/json.hpp>

#include "tierstage/stager/errors.hpp"

namespace tierstage::stager
{

    namespace
    {

        template <typename T>
        void read_optional(const nlohmann::json &json, const char *key, T &target)
        {
            if (json.contains(key) && !json.at(key).is_null())
            {
                target = json.at(key).get<T>();
            }
        }

        void read_path(const nlohmann::json &json, const char *key, std::filesystem::path &target)
        {
            if (json.contains(key) && json.at(key).is_string())
            {
                target = std::filesystem::path(json.at(key).get<std::string>());
            }
        }

        TransferToolConfig transfer_from_json(const nlohmann::json &json)
        {
            TransferToolConfig config;
            read_path(json, "bin_dir", config.bin_dir);
            read_optional(json, "copy", config.copy_command);
            read_optional(json, "remove", config.remove_command);
            read_optional(json, "list", config.list_command);
            read_optional(json, "move", config.move_command);
            read_optional(json, "tree_sync", config.tree_sync_command);
            return config;
        }

        WorkspaceConfig workspace_from_json(const nlohmann::json &json)
        {
            WorkspaceConfig config;
            read_path(json, "bin_dir", config.bin_dir);
            read_optional(json, "allocate", config.allocate_command);
            read_optional(json, "release", config.release_command);
            read_optional(json, "name", config.name);
            read_optional(json, "expire_days", config.expire_days);
            if (json.contains("filesystem") && json.at("filesystem").is_string())
            {
                config.filesystem = json.at("filesystem").get<std::string>();
            }
            if (json.contains("cache_root") && json.at("cache_root").is_string())
            {
                config.cache_root = std::filesystem::path(json.at("cache_root").get<std::string>());
            }
            return config;
        }

    } // namespace

    StagerConfig load_config(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "Cannot open config file: " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument,
                               "Malformed config file " + path.string() + ": " + ex.what());
        }
        if (!json.is_object())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "Config root must be a JSON object");
        }

        StagerConfig config;
        try
        {
            read_path(json, "remote_root", config.remote_root);
            read_path(json, "local_root", config.local_root);
            if (json.contains("transfer"))
            {
                config.transfer = transfer_from_json(json.at("transfer"));
            }
            if (json.contains("workspace"))
            {
                config.workspace = workspace_from_json(json.at("workspace"));
            }
            for (const auto &item : json.value("tier_boundaries", nlohmann::json::array()))
            {
                config.tier_boundaries.emplace_back(item.get<std::string>());
            }
            if (json.contains("poll_interval_ms"))
            {
                config.poll_interval = std::chrono::milliseconds(json.at("poll_interval_ms").get<long long>());
            }
            if (json.contains("log_file") && json.at("log_file").is_string())
            {
                config.log_file = std::filesystem::path(json.at("log_file").get<std::string>());
            }
            read_optional(json, "quiet", config.quiet);
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument,
                               "Invalid value in config file " + path.string() + ": " + ex.what());
        }

        return config;
    }

    void validate(const StagerConfig &config)
    {
        if (config.remote_root.empty())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "remote_root must be set");
        }
        if (config.local_root.empty())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "local_root must be set");
        }
        if (config.workspace.expire_days <= 0)
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "workspace expire_days must be positive");
        }
        if (config.poll_interval.count() <= 0)
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "poll_interval must be positive");
        }
    }

} // namespace tierstage::stager
