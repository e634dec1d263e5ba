#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "tierstage/logger.hpp"
#include "tierstage/stager/codecs.hpp"
#include "tierstage/stager/command_runner.hpp"
#include "tierstage/stager/config.hpp"
#include "tierstage/stager/directory_synchronizer.hpp"
#include "tierstage/stager/file_stager.hpp"
#include "tierstage/stager/sync_safety_gate.hpp"
#include "tierstage/stager/transfer_client.hpp"
#include "tierstage/stager/workspace.hpp"

namespace tierstage::stager
{

    // Connects a project space with a fileserver directory through the
    // cluster's transfer tools and a cache workspace. Owns every component
    // for one caller; not thread safe.
    class StagingSession
    {
    public:
        explicit StagingSession(StagerConfig config);
        StagingSession(StagerConfig config, Logger logger);

        StagingSession(const StagingSession &) = delete;
        StagingSession &operator=(const StagingSession &) = delete;

        std::filesystem::path resolve(const std::string &name,
                                      std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        {
            return stager_.resolve(name, timeout);
        }

        template <typename T>
        T load(const std::string &name, const Codec<T> &codec,
               std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        {
            return stager_.load(name, codec, timeout);
        }

        template <typename T>
        std::filesystem::path stage(const T &data, const std::string &name, const Codec<T> &writer,
                                    Tier target = Tier::Remote)
        {
            return stager_.stage(data, name, writer, target);
        }

        SyncOutput sync_directories(SyncDirection direction = SyncDirection::FromRemote, bool delete_extraneous = false,
                                    bool overwrite_newer = false, bool confirmed = false, bool dry_run = false);
        SyncOutput sync_directories(const SyncRequest &request);

        JobHandle remove(const std::string &name) { return stager_.remove(name); }
        bool remove_and_wait(const std::string &name,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds{20000})
        {
            return stager_.remove_and_wait(name, timeout);
        }

        std::vector<std::string> list_local_files() const { return stager_.list_local_files(); }
        std::vector<std::string> list_cache_files() const { return stager_.list_cache_files(); }
        std::vector<std::string> list_remote_files(int depth = -1) { return stager_.list_remote_files(depth); }

        void close() { stager_.close(); }

        const StagerConfig &config() const noexcept { return config_; }
        CommandRunner &runner() noexcept { return runner_; }
        FileStager &stager() noexcept { return stager_; }
        const SyncSafetyGate &gate() const noexcept { return gate_; }
        DirectorySynchronizer &synchronizer() noexcept { return synchronizer_; }

    private:
        StagerConfig config_;
        Logger logger_;
        CommandRunner runner_;
        TransferClient transfer_;
        WorkspaceAllocator workspaces_;
        FileStager stager_;
        SyncSafetyGate gate_;
        DirectorySynchronizer synchronizer_;
    };

} // namespace tierstage::stager
