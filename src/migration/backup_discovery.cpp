#include "pgshift/migration/backup_discovery.hpp"

#include "pgshift/log/logger.hpp"

namespace pgshift::migration {

BackupDiscovery::BackupDiscovery(MigrationContext context)
    : Step(saga::StepId::backup_discovery), context_(std::move(context)) {}

saga::StepOutcome BackupDiscovery::perform(const saga::ForwardRegistry&) {
    const auto& addon = context_.settings.backup_addon;
    PGSHIFT_LOG_INFO << "Installing " << addon;

    try {
        context_.api->provision_addon(context_.app, addon);
    } catch (const api::AddonConflictError&) {
        PGSHIFT_LOG_INFO << addon << " is already installed on "
                         << context_.app;
    }
    return {};
}

}  // namespace pgshift::migration
