#include "tierstage/stager/sync_safety_gate.hpp"

#include <algorithm>
#include <utility>

#include "tierstage/stager/errors.hpp"

namespace tierstage::stager
{

    namespace
    {

        std::filesystem::path canonical_form(const std::filesystem::path &path)
        {
            auto normalized = path.lexically_normal();
            while (!normalized.has_filename() && normalized.has_relative_path())
            {
                normalized = normalized.parent_path();
            }
            return normalized;
        }

    } // namespace

    std::string_view to_string(SyncDirection direction) noexcept
    {
        switch (direction)
        {
        case SyncDirection::ToRemote:
            return "to remote";
        case SyncDirection::FromRemote:
            return "from remote";
        }
        return "unknown";
    }

    SyncSafetyGate::SyncSafetyGate(std::vector<std::filesystem::path> tier_boundaries, Logger logger)
        : logger_(std::move(logger))
    {
        boundaries_.reserve(tier_boundaries.size());
        for (const auto &boundary : tier_boundaries)
        {
            boundaries_.push_back(canonical_form(boundary));
        }
    }

    SyncClassification SyncSafetyGate::classify(const SyncRequest &request, const std::filesystem::path &source_root,
                                                const std::filesystem::path &destination_root) const
    {
        SyncClassification result;
        if (request.dry_run)
        {
            result.reason = "dry run";
            return result;
        }

        if (request.delete_extraneous)
        {
            result.safe = false;
            result.reason = "files missing from the source would be deleted from the destination";
        }
        else if (request.overwrite_newer)
        {
            result.safe = false;
            result.reason = "newer files in the destination would be overwritten";
        }
        else if (is_tier_root(source_root) && is_tier_root(destination_root))
        {
            result.safe = false;
            result.reason = "an entire tier root would be mirrored onto another";
        }

        result.forced_dry_run = !result.safe && !request.confirmed;
        return result;
    }

    SyncOutput SyncSafetyGate::enforce(const SyncRequest &request, const std::filesystem::path &source_root,
                                       const std::filesystem::path &destination_root, const SyncRunner &run_sync) const
    {
        const auto classification = classify(request, source_root, destination_root);
        if (classification.forced_dry_run)
        {
            logger_.warn("gate", "unconfirmed sync ", source_root.string(), " -> ", destination_root.string(), ": ",
                         classification.reason, "; running as dry run");
            auto preview = run_sync(true);
            throw ConfirmationRequiredError(classification.reason, std::move(preview));
        }
        if (!classification.safe)
        {
            logger_.log("gate", "confirmed sync ", source_root.string(), " -> ", destination_root.string(), ": ",
                        classification.reason);
        }
        return run_sync(request.dry_run);
    }

    bool SyncSafetyGate::is_tier_root(const std::filesystem::path &path) const
    {
        const auto normalized = canonical_form(path);
        if (normalized.has_root_path() && !normalized.has_relative_path())
        {
            return true;
        }
        if (!normalized.has_relative_path())
        {
            return false;
        }
        const auto parent = normalized.parent_path();
        if (parent == normalized.root_path())
        {
            return true;
        }
        const auto is_boundary = [this](const std::filesystem::path &candidate)
        { return std::find(boundaries_.begin(), boundaries_.end(), candidate) != boundaries_.end(); };
        return is_boundary(normalized) || is_boundary(parent);
    }

} // namespace tierstage::stager
