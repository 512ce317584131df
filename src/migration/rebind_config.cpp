#include "pgshift/migration/rebind_config.hpp"

#include <stdexcept>

#include "pgshift/log/logger.hpp"

namespace pgshift::migration {

std::vector<std::string> find_rebindings(const api::ConfigVars& vars,
                                         const std::string& url) {
    std::vector<std::string> names;
    for (const auto& [name, value] : vars) {
        if (value == url) {
            names.push_back(name);
        }
    }
    return names;
}

api::ConfigVars bind_all(const std::vector<std::string>& names,
                         const std::string& url) {
    api::ConfigVars bindings;
    for (const auto& name : names) {
        bindings[name] = url;
    }
    return bindings;
}

std::string humanize(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

RebindConfig::RebindConfig(MigrationContext context)
    : Step(saga::StepId::rebind_config), context_(std::move(context)) {}

saga::StepOutcome RebindConfig::perform(
    const saga::ForwardRegistry& forward) {
    const auto& source = context_.settings.source_config_var;
    const auto& provisioned =
        forward.get<ProvisionResult>(saga::StepId::provision_database);

    auto new_url = provisioned.config.find(provisioned.binding_name);
    if (new_url == provisioned.config.end()) {
        throw std::runtime_error("Configuration variable " +
                                 provisioned.binding_name +
                                 " is missing from the provisioning snapshot");
    }

    auto vars = context_.api->get_config_vars(context_.app);
    auto old_url = vars.find(source);
    if (old_url == vars.end()) {
        throw saga::AbortCleanly("No " + source + " found: cannot migrate.");
    }

    auto names = find_rebindings(vars, old_url->second);
    PGSHIFT_LOG_INFO << "Binding new database configuration to: "
                     << humanize(names);

    rebinding_ = Rebinding{names, old_url->second};
    try {
        context_.api->put_config_vars(context_.app,
                                      bind_all(names, new_url->second));
    } catch (const std::exception& e) {
        throw saga::NeedsCompensation(e.what());
    }

    return {};
}

void RebindConfig::rollback() {
    if (!rebinding_) {
        return;
    }

    PGSHIFT_LOG_INFO << "Binding old database configuration to: "
                     << humanize(rebinding_->names);
    context_.api->put_config_vars(
        context_.app, bind_all(rebinding_->names, rebinding_->old_url));
}

}  // namespace pgshift::migration
