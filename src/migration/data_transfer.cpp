#include "pgshift/migration/data_transfer.hpp"

#include <stdexcept>

#include "pgshift/log/logger.hpp"
#include "pgshift/transfer/transfer_poller.hpp"

namespace pgshift::migration {

namespace {

const std::string& require_var(const api::ConfigVars& vars,
                               const std::string& name) {
    auto it = vars.find(name);
    if (it == vars.end()) {
        throw std::runtime_error("Configuration variable " + name +
                                 " is missing from the provisioning snapshot");
    }
    return it->second;
}

}  // namespace

DataTransfer::DataTransfer(MigrationContext context)
    : Step(saga::StepId::data_transfer), context_(std::move(context)) {}

saga::StepOutcome DataTransfer::perform(
    const saga::ForwardRegistry& forward) {
    const auto& settings = context_.settings;
    const auto& provisioned =
        forward.get<ProvisionResult>(saga::StepId::provision_database);

    auto endpoint = provisioned.config.find(settings.transfer_endpoint_var);
    if (endpoint == provisioned.config.end()) {
        throw saga::AbortCleanly("No " + settings.transfer_endpoint_var +
                                 " found: cannot transfer data.");
    }

    const auto& from_url =
        require_var(provisioned.config, settings.source_config_var);
    const auto& to_url =
        require_var(provisioned.config, provisioned.binding_name);

    PGSHIFT_LOG_INFO << "Transferring " << settings.source_config_var
                     << " to " << provisioned.binding_name;

    auto service = context_.transfer_service(endpoint->second);
    auto started = service->create_transfer(from_url,
                                            settings.source_config_var,
                                            to_url, provisioned.binding_name);

    transfer::TransferPoller poller(
        *service, std::chrono::milliseconds(settings.poll_interval_ms),
        *context_.token);
    auto finished = poller.wait(std::move(started));

    if (finished.failed()) {
        throw saga::AbortCleanly(transfer::describe_failure(finished));
    }

    PGSHIFT_LOG_INFO << "Transfer complete";
    return {};
}

}  // namespace pgshift::migration
