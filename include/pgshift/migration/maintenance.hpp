#pragma once

#include "pgshift/migration/migration_context.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::migration {

// Puts the application into maintenance mode; the rollback takes it out
// again. Registers itself for compensation whether or not enabling worked.
class Maintenance : public saga::Step {
public:
    explicit Maintenance(MigrationContext context);

    saga::StepOutcome perform(const saga::ForwardRegistry& forward) override;

    bool has_rollback() const override { return true; }
    void rollback() override;

private:
    MigrationContext context_;
    bool requested_ = false;  // set once enabling was attempted
};

}  // namespace pgshift::migration
