#include "pgshift/migration/migration_plan.hpp"

#include <stdexcept>

#include "pgshift/migration/backup_discovery.hpp"
#include "pgshift/migration/check_source.hpp"
#include "pgshift/migration/data_transfer.hpp"
#include "pgshift/migration/maintenance.hpp"
#include "pgshift/migration/provision_database.hpp"
#include "pgshift/migration/rebind_config.hpp"
#include "pgshift/migration/scale_zero.hpp"

namespace pgshift::migration {

std::vector<saga::StepPtr> build_migration_plan(
    const MigrationContext& context) {
    if (!context.api) {
        throw std::invalid_argument("Migration needs a control plane client");
    }
    if (!context.transfer_service) {
        throw std::invalid_argument("Migration needs a transfer service");
    }
    if (context.token == nullptr) {
        throw std::invalid_argument("Migration needs a cancellation token");
    }
    if (context.app.empty()) {
        throw std::invalid_argument("Migration needs an application name");
    }

    return {std::make_shared<CheckSource>(context),
            std::make_shared<BackupDiscovery>(context),
            std::make_shared<ProvisionDatabase>(context),
            std::make_shared<Maintenance>(context),
            std::make_shared<ScaleZero>(context),
            std::make_shared<DataTransfer>(context),
            std::make_shared<RebindConfig>(context)};
}

}  // namespace pgshift::migration
