#include "tierstage/stager/directory_synchronizer.hpp"

#include <utility>

#include "tierstage/stager/errors.hpp"
#include "tierstage/string_util.hpp"

namespace tierstage::stager
{

    namespace
    {

        std::filesystem::path without_trailing_separator(const std::filesystem::path &path)
        {
            auto normalized = path.lexically_normal();
            while (!normalized.has_filename() && normalized.has_relative_path())
            {
                normalized = normalized.parent_path();
            }
            return normalized;
        }

        // A trailing separator makes the tree sync copy the contents of the
        // directory instead of the directory itself.
        std::string contents_of(const std::filesystem::path &directory)
        {
            auto text = without_trailing_separator(directory).string();
            if (text.empty() || text.back() != '/')
            {
                text += '/';
            }
            return text;
        }

    } // namespace

    DirectorySynchronizer::DirectorySynchronizer(std::filesystem::path local_root, std::filesystem::path remote_root,
                                                 TransferClient &transfer, const SyncSafetyGate &gate, Logger logger)
        : local_root_(without_trailing_separator(std::filesystem::absolute(local_root))),
          remote_root_(without_trailing_separator(std::filesystem::absolute(remote_root))),
          transfer_(transfer),
          gate_(gate),
          logger_(std::move(logger)) {}

    void DirectorySynchronizer::exclude(std::filesystem::path owned_directory)
    {
        excluded_.push_back(without_trailing_separator(std::filesystem::absolute(owned_directory)));
    }

    SyncOutput DirectorySynchronizer::sync(const SyncRequest &request)
    {
        const auto source = source_root(request.direction);
        const auto destination = destination_root(request.direction);
        logger_.log("sync", to_string(request.direction), ": ", source.string(), " -> ", destination.string(),
                    request.delete_extraneous ? " [delete]" : "", request.overwrite_newer ? " [overwrite newer]" : "",
                    request.dry_run ? " [dry run]" : "");
        return gate_.enforce(request, source, destination, [this, &request](bool dry_run)
                             { return run(request, dry_run); });
    }

    std::vector<std::string> DirectorySynchronizer::build_options(const SyncRequest &request, bool dry_run) const
    {
        std::vector<std::string> options{"-a", "-v"};
        if (!request.overwrite_newer)
        {
            options.emplace_back("-u");
        }
        if (request.delete_extraneous)
        {
            options.emplace_back("--delete");
        }
        if (dry_run)
        {
            options.emplace_back("--dry-run");
        }

        // Excluded on either side: never copied out of its tier and never
        // deleted from it.
        const std::filesystem::path roots[] = {source_root(request.direction), destination_root(request.direction)};
        for (const auto &directory : excluded_)
        {
            for (const auto &root : roots)
            {
                const auto relative = directory.lexically_relative(root);
                if (relative.empty() || relative == "." || *relative.begin() == "..")
                {
                    continue;
                }
                // Anchored to the transfer root so equally named directories deeper down still sync.
                options.push_back("--exclude=/" + relative.generic_string() + "/");
                break;
            }
        }
        return options;
    }

    std::filesystem::path DirectorySynchronizer::source_root(SyncDirection direction) const
    {
        return direction == SyncDirection::ToRemote ? local_root_ : remote_root_;
    }

    std::filesystem::path DirectorySynchronizer::destination_root(SyncDirection direction) const
    {
        return direction == SyncDirection::ToRemote ? remote_root_ : local_root_;
    }

    SyncOutput DirectorySynchronizer::run(const SyncRequest &request, bool dry_run)
    {
        const auto source = source_root(request.direction);
        const auto destination = destination_root(request.direction);
        const auto options = build_options(request, dry_run);

        auto job = transfer_.tree_sync(options, contents_of(source), destination.string());
        auto &runner = transfer_.runner();
        const auto exit_code = runner.wait(*job);
        auto output = runner.drain(*job);

        SyncOutput result{
            .command = job->command(),
            .exit_code = exit_code.value_or(-1),
            .out = std::move(output.out),
            .err = std::move(output.err),
            .dry_run = dry_run,
        };
        if (result.exit_code != 0)
        {
            logger_.error("sync", "tree sync exited with ", result.exit_code, ": ", trim(result.err));
            throw TransferFailedError(source.string(), result.exit_code, trim(result.err));
        }
        logger_.log("sync", dry_run ? "dry run" : "sync", " finished for ", source.string());
        return result;
    }

} // namespace tierstage::stager
