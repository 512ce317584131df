#pragma once

#include "pgshift/migration/migration_context.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::migration {

// Confirms the application still has the source database bound
class CheckSource : public saga::Step {
public:
    explicit CheckSource(MigrationContext context);

    saga::StepOutcome perform(const saga::ForwardRegistry& forward) override;

private:
    MigrationContext context_;
};

}  // namespace pgshift::migration
