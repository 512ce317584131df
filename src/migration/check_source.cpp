#include "pgshift/migration/check_source.hpp"

#include "pgshift/log/logger.hpp"

namespace pgshift::migration {

CheckSource::CheckSource(MigrationContext context)
    : Step(saga::StepId::check_source), context_(std::move(context)) {}

saga::StepOutcome CheckSource::perform(const saga::ForwardRegistry&) {
    const auto& source = context_.settings.source_config_var;
    PGSHIFT_LOG_INFO << "Checking " << context_.app << " for " << source;

    auto vars = context_.api->get_config_vars(context_.app);
    if (vars.count(source) == 0) {
        throw saga::AbortCleanly("No " + source +
                                 " found: cannot migrate.");
    }
    return {};
}

}  // namespace pgshift::migration
