#pragma once

#include "pgshift/migration/migration_context.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::migration {

// Makes sure the transfer service add-on is installed on the application.
// An add-on that is already present counts as success.
class BackupDiscovery : public saga::Step {
public:
    explicit BackupDiscovery(MigrationContext context);

    saga::StepOutcome perform(const saga::ForwardRegistry& forward) override;

private:
    MigrationContext context_;
};

}  // namespace pgshift::migration
