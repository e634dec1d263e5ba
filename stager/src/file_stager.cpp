#include "tierstage/stager/file_stager.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <utility>

#include <unistd.h>

#include "tierstage/crypto.hpp"
#include "tierstage/stager/errors.hpp"
#include "tierstage/string_util.hpp"

namespace tierstage::stager
{

    namespace
    {
        constexpr auto kCacheDirName = "cache";
        constexpr auto kScratchDirName = ".scratch";

        std::filesystem::path normalize_root(const std::filesystem::path &root)
        {
            auto normalized = std::filesystem::absolute(root).lexically_normal();
            if (!normalized.has_filename() && normalized.has_relative_path())
            {
                normalized = normalized.parent_path();
            }
            return normalized;
        }

        // Logical names are joined below a tier root, never replace it.
        std::string strip_leading_separators(const std::string &name)
        {
            const auto begin = name.find_first_not_of('/');
            return begin == std::string::npos ? std::string{} : name.substr(begin);
        }

        bool is_within(const std::filesystem::path &path, const std::filesystem::path &root)
        {
            const auto relative = path.lexically_normal().lexically_relative(root);
            return !relative.empty() && *relative.begin() != "..";
        }

    } // namespace

    std::string_view to_string(Tier tier) noexcept
    {
        switch (tier)
        {
        case Tier::Local:
            return "local";
        case Tier::Cache:
            return "cache";
        case Tier::Remote:
            return "remote";
        }
        return "unknown";
    }

    FileStager::FileStager(const StagerConfig &config, TransferClient &transfer, WorkspaceAllocator &workspaces,
                           Logger logger)
        : remote_root_(normalize_root(config.remote_root)),
          local_root_(normalize_root(config.local_root)),
          transfer_(transfer),
          workspaces_(workspaces),
          logger_(std::move(logger))
    {
        std::filesystem::create_directories(local_root_);

        std::filesystem::path cache_base;
        if (config.workspace.cache_root)
        {
            cache_base = normalize_root(*config.workspace.cache_root);
        }
        else
        {
            workspace_ = workspaces_.allocate(config.workspace.expire_days);
            cache_base = workspace_->path;
        }

        cache_dir_ = cache_base / kCacheDirName;
        try
        {
            std::filesystem::create_directories(cache_dir_);
        }
        catch (const std::filesystem::filesystem_error &)
        {
            if (workspace_)
            {
                workspaces_.release(workspace_->name);
            }
            throw;
        }
        open_ = true;
        logger_.log("stager", "remote ", remote_root_.string(), ", local ", local_root_.string(), ", cache ",
                    cache_dir_.string());
    }

    FileStager::~FileStager()
    {
        try
        {
            close();
        }
        catch (const std::exception &ex)
        {
            logger_.error("stager", "cleanup failed: ", ex.what());
        }
    }

    std::filesystem::path FileStager::resolve(const std::string &logical_name, std::chrono::milliseconds timeout)
    {
        ensure_open();
        if (logical_name.empty())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "Cannot resolve an empty file name");
        }

        std::error_code ec;
        const std::filesystem::path as_given(logical_name);
        if (std::filesystem::is_regular_file(as_given, ec))
        {
            logger_.debug("stager", logical_name, " is directly accessible");
            return as_given;
        }

        const auto normalized = normalize_name(logical_name);
        const auto relative = strip_leading_separators(normalized);
        const auto filename = base_name(normalized);
        if (relative.empty() || filename.empty())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "Not a file name: " + logical_name);
        }

        const auto local_candidate = local_root_ / relative;
        if (std::filesystem::is_regular_file(local_candidate, ec))
        {
            logger_.log("stager", logical_name, " found in project space");
            return local_candidate;
        }

        const auto cache_target = cache_dir_ / filename;
        if (std::filesystem::exists(cache_target, ec))
        {
            logger_.log("stager", logical_name, " already cached at ", cache_target.string());
            return cache_target;
        }

        const auto remote_source = (remote_root_ / relative).lexically_normal();
        if (!is_within(remote_source, remote_root_))
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument,
                               "Refusing to stage from outside the fileserver directory: " + logical_name);
        }
        logger_.log("stager", "staging ", remote_source.string(), " into cache");
        auto job = transfer_.copy(true, remote_source.string(), cache_target.string());
        auto &runner = transfer_.runner();
        const auto exit_code = runner.wait(*job, timeout);
        if (!exit_code)
        {
            auto command = job->command();
            abandoned_.push_back(std::move(job));
            throw TimeoutError(std::move(command));
        }
        auto output = runner.drain(*job);
        if (*exit_code > 0)
        {
            logger_.warn("stager", "copy of ", remote_source.string(), " exited with ", *exit_code);
            throw NotFoundError(logical_name, remote_source, trim(output.err));
        }
        return cache_target;
    }

    JobHandle FileStager::remove(const std::string &name)
    {
        ensure_open();
        const auto target = removal_target(name);
        logger_.log("stager", "removing ", target.string());
        return transfer_.remove(true, target.string());
    }

    bool FileStager::remove_and_wait(const std::string &name, std::chrono::milliseconds timeout)
    {
        auto job = remove(name);
        auto &runner = transfer_.runner();
        const auto exit_code = runner.wait(*job, timeout);
        if (!exit_code)
        {
            abandoned_.push_back(std::move(job));
            return false;
        }
        auto output = runner.drain(*job);
        if (*exit_code > 0)
        {
            throw TransferFailedError(name, *exit_code, trim(output.err));
        }
        return true;
    }

    std::vector<std::string> FileStager::list_local_files() const
    {
        std::vector<std::string> files;
        std::error_code ec;
        for (std::filesystem::recursive_directory_iterator it(local_root_, ec), end; !ec && it != end; it.increment(ec))
        {
            files.push_back(it->path().string());
        }
        if (ec)
        {
            logger_.warn("stager", "listing ", local_root_.string(), " stopped: ", ec.message());
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector<std::string> FileStager::list_cache_files() const
    {
        std::vector<std::string> files;
        std::error_code ec;
        for (std::filesystem::directory_iterator it(cache_dir_, ec), end; !ec && it != end; it.increment(ec))
        {
            const auto name = it->path().filename().string();
            if (name != kScratchDirName)
            {
                files.push_back(name);
            }
        }
        std::sort(files.begin(), files.end());
        return files;
    }

    std::vector<std::string> FileStager::list_remote_files(int depth)
    {
        ensure_open();
        auto job = transfer_.list(remote_root_.string(), depth);
        auto &runner = transfer_.runner();
        const auto exit_code = runner.wait(*job);
        auto output = runner.drain(*job);
        if (!exit_code || *exit_code > 0)
        {
            logger_.warn("stager", "list operation exited with error: ", trim(output.err));
        }
        return parse_listing(output.out, remote_root_, depth);
    }

    void FileStager::close()
    {
        if (!open_)
        {
            return;
        }
        open_ = false;

        auto &runner = transfer_.runner();
        for (auto &job : abandoned_)
        {
            if (!runner.poll(*job))
            {
                logger_.warn("stager", "pid ", job->pid(), " is still running: ", join_command(job->command()));
            }
        }
        abandoned_.clear();

        std::error_code ec;
        std::filesystem::remove_all(cache_dir_, ec);
        if (ec)
        {
            logger_.warn("stager", "could not remove ", cache_dir_.string(), ": ", ec.message());
        }
        else
        {
            logger_.log("stager", "removed cache ", cache_dir_.string());
        }

        if (workspace_)
        {
            const auto name = workspace_->name;
            workspace_.reset();
            workspaces_.release(name);
        }
    }

    std::string FileStager::normalize_name(const std::string &logical_name)
    {
        auto normalized = logical_name;
        std::replace(normalized.begin(), normalized.end(), '\\', '/');
        return normalized;
    }

    std::string FileStager::base_name(const std::string &normalized_name)
    {
        const auto end = normalized_name.find_last_not_of('/');
        if (end == std::string::npos)
        {
            return {};
        }
        const auto slash = normalized_name.find_last_of('/', end);
        const auto begin = slash == std::string::npos ? 0 : slash + 1;
        return normalized_name.substr(begin, end - begin + 1);
    }

    std::vector<std::string> FileStager::parse_listing(const std::string &output, const std::filesystem::path &root,
                                                       int depth)
    {
        std::vector<std::string> entries;
        std::istringstream stream(output);
        std::string line;
        std::filesystem::path current;
        bool section_start = true;

        while (std::getline(stream, line))
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            if (line.empty())
            {
                section_start = true;
                continue;
            }
            // Recursive listings open each directory with "<dir>:".
            if (section_start && line.back() == ':')
            {
                const std::filesystem::path directory(line.substr(0, line.size() - 1));
                current = directory.lexically_normal().lexically_relative(root.lexically_normal());
                if (current == ".")
                {
                    current.clear();
                }
                section_start = false;
                continue;
            }
            section_start = false;

            const auto entry = (current / line).generic_string();
            const auto components = static_cast<int>(std::count(entry.begin(), entry.end(), '/')) + 1;
            if (depth < 0 || components <= depth + 1)
            {
                entries.push_back(entry);
            }
        }
        std::sort(entries.begin(), entries.end());
        return entries;
    }

    void FileStager::ensure_open() const
    {
        if (!open_)
        {
            throw StagingError(tierstage::ErrorCode::InvalidState, "File stager has been closed");
        }
    }

    std::filesystem::path FileStager::destination_for(const std::string &logical_name, Tier target) const
    {
        const auto normalized = normalize_name(logical_name);
        const auto relative = strip_leading_separators(normalized);
        const auto filename = base_name(normalized);
        if (relative.empty() || filename.empty())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "Not a file name: " + logical_name);
        }
        switch (target)
        {
        case Tier::Local:
            return local_root_ / relative;
        case Tier::Cache:
            return cache_dir_ / filename;
        case Tier::Remote:
            break;
        }
        return remote_root_ / relative;
    }

    bool FileStager::is_locally_writable(const std::filesystem::path &directory)
    {
        std::error_code ec;
        std::filesystem::create_directories(directory, ec);
        return !ec && ::access(directory.c_str(), W_OK) == 0;
    }

    std::filesystem::path FileStager::reserve_scratch(const std::filesystem::path &filename) const
    {
        const auto directory = cache_dir_ / kScratchDirName / crypto::random_token();
        std::filesystem::create_directories(directory);
        return directory / filename;
    }

    void FileStager::commit_scratch(const std::filesystem::path &scratch, const std::filesystem::path &destination,
                                    Tier target, const std::string &logical_name)
    {
        const auto digest = crypto::hash_file(scratch);
        auto &runner = transfer_.runner();
        auto job = transfer_.move(scratch.string(), destination.string());
        const auto exit_code = runner.wait(*job);
        auto output = runner.drain(*job);

        std::error_code ec;
        std::filesystem::remove_all(scratch.parent_path(), ec);

        if (!exit_code || *exit_code != 0)
        {
            throw TransferFailedError(logical_name, exit_code.value_or(-1), trim(output.err));
        }
        if (target != Tier::Remote)
        {
            if (crypto::hash_file(destination) != digest)
            {
                throw TransferFailedError(logical_name, 0, "checksum mismatch after move to " + destination.string());
            }
        }
        logger_.log("stager", "staged ", logical_name, " to ", to_string(target), " tier (", digest, ")");
    }

    std::filesystem::path FileStager::removal_target(const std::string &name) const
    {
        const auto normalized = normalize_name(name);
        const std::filesystem::path candidate(normalized);
        if (candidate.is_absolute())
        {
            if (!is_within(candidate, local_root_))
            {
                throw StagingError(tierstage::ErrorCode::InvalidArgument,
                                   "Refusing to remove outside the project space: " + name);
            }
            return candidate.lexically_normal();
        }
        const auto relative = strip_leading_separators(normalized);
        if (relative.empty())
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument, "Not a file name: " + name);
        }
        const auto target = (local_root_ / relative).lexically_normal();
        if (!is_within(target, local_root_))
        {
            throw StagingError(tierstage::ErrorCode::InvalidArgument,
                               "Refusing to remove outside the project space: " + name);
        }
        return target;
    }

} // namespace tierstage::stager
