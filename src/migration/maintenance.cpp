#include "pgshift/migration/maintenance.hpp"

#include "pgshift/log/logger.hpp"

namespace pgshift::migration {

Maintenance::Maintenance(MigrationContext context)
    : Step(saga::StepId::maintenance), context_(std::move(context)) {}

saga::StepOutcome Maintenance::perform(const saga::ForwardRegistry&) {
    PGSHIFT_LOG_INFO << "Entering maintenance mode on application "
                     << context_.app;

    requested_ = true;
    try {
        context_.api->set_maintenance(context_.app, true);
    } catch (const std::exception& e) {
        throw saga::NeedsCompensation(e.what());
    }

    return compensate_self();
}

void Maintenance::rollback() {
    if (!requested_) {
        return;
    }

    PGSHIFT_LOG_INFO << "Leaving maintenance mode on application "
                     << context_.app;
    context_.api->set_maintenance(context_.app, false);
}

}  // namespace pgshift::migration
