#pragma once

#include <optional>

#include "pgshift/api/types.hpp"
#include "pgshift/migration/migration_context.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::migration {

// Scales every process type down to zero, remembering the previous counts
// so the rollback can restore them.
class ScaleZero : public saga::Step {
public:
    explicit ScaleZero(MigrationContext context);

    saga::StepOutcome perform(const saga::ForwardRegistry& forward) override;

    bool has_rollback() const override { return true; }
    void rollback() override;

    const std::optional<api::ProcessCounts>& previous_counts() const {
        return previous_counts_;
    }

private:
    MigrationContext context_;
    std::optional<api::ProcessCounts> previous_counts_;  // empty until read
};

}  // namespace pgshift::migration
