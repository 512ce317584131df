#pragma once

#include <vector>

#include "pgshift/migration/migration_context.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::migration {

// Initial queue of the migration, in dependency order:
// CheckSource, BackupDiscovery, ProvisionDatabase, Maintenance, ScaleZero,
// DataTransfer, RebindConfig.
std::vector<saga::StepPtr> build_migration_plan(const MigrationContext& context);

}  // namespace pgshift::migration
