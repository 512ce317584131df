#include "pgshift/migration/provision_database.hpp"

#include <stdexcept>

#include "pgshift/log/logger.hpp"

namespace pgshift::migration {

std::optional<std::string> parse_attachment_name(const std::string& message,
                                                 const std::regex& pattern) {
    auto end = message.find_last_not_of(" \r\n");
    const std::string trimmed =
        end == std::string::npos ? "" : message.substr(0, end + 1);

    std::smatch match;
    if (std::regex_search(trimmed, match, pattern) && match.size() > 1 &&
        match[1].matched) {
        return match[1].str();
    }
    return std::nullopt;
}

ProvisionDatabase::ProvisionDatabase(MigrationContext context)
    : Step(saga::StepId::provision_database), context_(std::move(context)) {}

saga::StepOutcome ProvisionDatabase::perform(const saga::ForwardRegistry&) {
    const auto& settings = context_.settings;
    PGSHIFT_LOG_INFO << "Installing " << settings.database_addon;

    auto added = context_.api->provision_addon(context_.app,
                                               settings.database_addon);
    auto binding = parse_attachment_name(
        added.message, std::regex(settings.attachment_pattern));
    if (!binding) {
        throw std::runtime_error("Could not determine the attachment of " +
                                 settings.database_addon + " from: \"" +
                                 added.message + "\"");
    }
    PGSHIFT_LOG_INFO << "  attached as " << *binding;

    auto vars = context_.api->get_config_vars(context_.app);
    if (vars.count(settings.source_config_var) == 0) {
        throw saga::AbortCleanly("No " + settings.source_config_var +
                                 " found: cannot migrate.");
    }
    if (vars.count(*binding) == 0) {
        throw std::runtime_error("Configuration variable " + *binding +
                                 " is missing after provisioning");
    }

    saga::StepOutcome outcome;
    outcome.forward = ProvisionResult{*binding, std::move(vars)};
    return outcome;
}

}  // namespace pgshift::migration
