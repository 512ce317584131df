#pragma once

#include <optional>
#include <regex>
#include <string>

#include "pgshift/migration/migration_context.hpp"
#include "pgshift/saga/step.hpp"

namespace pgshift::migration {

/**
 * @brief Provisions the destination database.
 *
 * Publishes a ProvisionResult holding the configuration variable the new
 * database was attached as and a snapshot of the application's
 * configuration. Aborts cleanly if the source binding disappeared since the
 * pre-flight check.
 */
class ProvisionDatabase : public saga::Step {
public:
    explicit ProvisionDatabase(MigrationContext context);

    saga::StepOutcome perform(const saga::ForwardRegistry& forward) override;

private:
    MigrationContext context_;
};

// Variable name captured by the first group of pattern, if any
std::optional<std::string> parse_attachment_name(const std::string& message,
                                                 const std::regex& pattern);

}  // namespace pgshift::migration
