#pragma once

#include <optional>
#include <string>
#include <vector>

#include "pgshift/api/types.hpp"
#include "pgshift/migration/migration_context.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::migration {

/**
 * @brief Points every configuration variable that holds the old database
 * URL at the new database.
 *
 * Only a failed rebind registers for compensation; the rollback binds the
 * same variables back to the old URL.
 */
class RebindConfig : public saga::Step {
public:
    struct Rebinding {
        std::vector<std::string> names;
        std::string old_url;
    };

    explicit RebindConfig(MigrationContext context);

    saga::StepOutcome perform(const saga::ForwardRegistry& forward) override;

    bool has_rollback() const override { return true; }
    void rollback() override;

private:
    MigrationContext context_;
    std::optional<Rebinding> rebinding_;  // set right before the write
};

// Names of every variable whose value equals url
std::vector<std::string> find_rebindings(const api::ConfigVars& vars,
                                         const std::string& url);

api::ConfigVars bind_all(const std::vector<std::string>& names,
                         const std::string& url);

// How a list of variable names is shown to the operator
std::string humanize(const std::vector<std::string>& names);

}  // namespace pgshift::migration
