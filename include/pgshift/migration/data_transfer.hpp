#pragma once

#include "pgshift/migration/migration_context.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::migration {

/**
 * @brief Copies the source database into the newly provisioned one.
 *
 * Reads the source and destination URLs and the transfer service endpoint
 * from the ProvisionResult snapshot, starts the copy and waits for it. A
 * transfer that reports an error aborts the run cleanly; the destination
 * database is left as is for the operator to inspect.
 */
class DataTransfer : public saga::Step {
public:
    explicit DataTransfer(MigrationContext context);

    saga::StepOutcome perform(const saga::ForwardRegistry& forward) override;

private:
    MigrationContext context_;
};

}  // namespace pgshift::migration
