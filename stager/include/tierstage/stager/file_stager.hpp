#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tierstage/logger.hpp"
#include "tierstage/stager/codecs.hpp"
#include "tierstage/stager/command_runner.hpp"
#include "tierstage/stager/config.hpp"
#include "tierstage/stager/transfer_client.hpp"
#include "tierstage/stager/workspace.hpp"

namespace tierstage::stager
{

    enum class Tier
    {
        Local,
        Cache,
        Remote
    };

    std::string_view to_string(Tier tier) noexcept;

    // Resolves logical file names against the local project space, the cache
    // subdirectory it owns and the remote fileserver, copying into the cache
    // only on a full miss.
    //
    // Not thread safe: resolve() checks the cache and then copies, so two
    // threads resolving the same name may both launch a copy into the same
    // cache target. Callers sharing an instance must serialize calls.
    class FileStager
    {
    public:
        // Allocates the cache workspace (unless a fixed cache root is
        // configured) and creates the owned cache subdirectory.
        FileStager(const StagerConfig &config, TransferClient &transfer, WorkspaceAllocator &workspaces, Logger logger);
        ~FileStager();

        FileStager(const FileStager &) = delete;
        FileStager &operator=(const FileStager &) = delete;

        // First match wins: the name as given, <local>/<name>, <cache>/<basename>,
        // then a recursive copy from <remote>/<name> into the cache.
        // Cached copies are returned as they are, even if the remote file changed since.
        std::filesystem::path resolve(const std::string &logical_name,
                                      std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

        template <typename T>
        T load(const std::string &logical_name, const Codec<T> &codec,
               std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        {
            return codec.load(resolve(logical_name, timeout));
        }

        // Writes `data` for `logical_name` into the target tier. Destinations
        // that are not locally writable are written to a private scratch
        // file first and moved into place by a transfer job.
        template <typename T>
        std::filesystem::path stage(const T &data, const std::string &logical_name, const Codec<T> &writer,
                                    Tier target = Tier::Remote)
        {
            ensure_open();
            const auto destination = destination_for(logical_name, target);
            if (target != Tier::Remote && is_locally_writable(destination.parent_path()))
            {
                writer.save(destination, data);
                logger_.log("stager", "wrote ", writer.name(), " ", destination.string());
                return destination;
            }

            const auto scratch = reserve_scratch(destination.filename());
            writer.save(scratch, data);
            commit_scratch(scratch, destination, target, logical_name);
            return destination;
        }

        // Launches a recursive remove of `name` inside the project space and
        // returns without waiting.
        JobHandle remove(const std::string &name);

        // Returns false if the remove job is still running after `timeout`.
        bool remove_and_wait(const std::string &name,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds{20000});

        std::vector<std::string> list_local_files() const;
        std::vector<std::string> list_cache_files() const;
        std::vector<std::string> list_remote_files(int depth = -1);

        const std::filesystem::path &local_root() const noexcept { return local_root_; }
        const std::filesystem::path &remote_root() const noexcept { return remote_root_; }
        const std::filesystem::path &cache_dir() const noexcept { return cache_dir_; }
        bool is_open() const noexcept { return open_; }

        // Deletes the cache subdirectory and releases the workspace. Safe to
        // call more than once.
        void close();

        static std::string normalize_name(const std::string &logical_name);
        static std::string base_name(const std::string &normalized_name);
        static std::vector<std::string> parse_listing(const std::string &output, const std::filesystem::path &root,
                                                      int depth);

    private:
        void ensure_open() const;
        std::filesystem::path destination_for(const std::string &logical_name, Tier target) const;
        static bool is_locally_writable(const std::filesystem::path &directory);
        std::filesystem::path reserve_scratch(const std::filesystem::path &filename) const;
        void commit_scratch(const std::filesystem::path &scratch, const std::filesystem::path &destination, Tier target,
                            const std::string &logical_name);
        std::filesystem::path removal_target(const std::string &name) const;

        std::filesystem::path remote_root_;
        std::filesystem::path local_root_;
        TransferClient &transfer_;
        WorkspaceAllocator &workspaces_;
        Logger logger_;
        std::optional<Workspace> workspace_;
        std::filesystem::path cache_dir_;
        std::vector<JobHandle> abandoned_;
        bool open_{false};
    };

} // namespace tierstage::stager
