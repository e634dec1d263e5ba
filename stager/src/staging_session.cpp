#include "tierstage/stager/staging_session.hpp"

#include <utility>

namespace tierstage::stager
{

    namespace
    {

        StagerConfig validated(StagerConfig config)
        {
            validate(config);
            return config;
        }

    } // namespace

    StagingSession::StagingSession(StagerConfig config)
        : StagingSession(config, Logger(config.log_file, !config.quiet)) {}

    StagingSession::StagingSession(StagerConfig config, Logger logger)
        : config_(validated(std::move(config))),
          logger_(std::move(logger)),
          runner_(logger_, config_.poll_interval),
          transfer_(config_.transfer, runner_, logger_),
          workspaces_(config_.workspace, runner_, logger_),
          stager_(config_, transfer_, workspaces_, logger_),
          gate_(config_.tier_boundaries, logger_),
          synchronizer_(stager_.local_root(), stager_.remote_root(), transfer_, gate_, logger_)
    {
        synchronizer_.exclude(stager_.cache_dir());
    }

    SyncOutput StagingSession::sync_directories(SyncDirection direction, bool delete_extraneous, bool overwrite_newer,
                                                bool confirmed, bool dry_run)
    {
        return sync_directories(SyncRequest{
            .direction = direction,
            .delete_extraneous = delete_extraneous,
            .overwrite_newer = overwrite_newer,
            .dry_run = dry_run,
            .confirmed = confirmed,
        });
    }

    SyncOutput StagingSession::sync_directories(const SyncRequest &request)
    {
        return synchronizer_.sync(request);
    }

} // namespace tierstage::stager
