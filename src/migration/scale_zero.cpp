#include "pgshift/migration/scale_zero.hpp"

#include "pgshift/log/logger.hpp"

namespace pgshift::migration {

ScaleZero::ScaleZero(MigrationContext context)
    : Step(saga::StepId::scale_zero), context_(std::move(context)) {}

saga::StepOutcome ScaleZero::perform(const saga::ForwardRegistry&) {
    previous_counts_.reset();

    // Failing here leaves nothing to undo
    previous_counts_ = context_.api->get_process_counts(context_.app);

    if (previous_counts_->empty()) {
        PGSHIFT_LOG_INFO << "No active processes to scale down, skipping";
    }

    try {
        for (const auto& [type, count] : *previous_counts_) {
            PGSHIFT_LOG_INFO << "Scaling process " << type << " to 0";
            context_.api->set_process_count(context_.app, type, 0);
        }
    } catch (const std::exception& e) {
        // Some process types may already be at zero
        throw saga::NeedsCompensation(e.what());
    }

    return compensate_self();
}

void ScaleZero::rollback() {
    if (!previous_counts_) {
        return;
    }

    for (const auto& [type, count] : *previous_counts_) {
        PGSHIFT_LOG_INFO << "Restoring process " << type << " scale to "
                         << count;
        context_.api->set_process_count(context_.app, type, count);
    }
}

}  // namespace pgshift::migration
