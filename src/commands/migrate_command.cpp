#include "pgshift/commands/migrate_command.hpp"

#include <iostream>

#include "pgshift/api/heroku_control_plane.hpp"
#include "pgshift/api/pgbackups_client.hpp"
#include "pgshift/commands/runtime.hpp"
#include "pgshift/log/logger.hpp"
#include "pgshift/migration/migration_plan.hpp"
#include "pgshift/saga/saga_executor.hpp"

namespace pgshift::commands {

MigrateCommand::MigrateCommand()
    : cli::Command("migrate",
                   "Migrate from a legacy shared database to a dedicated "
                   "database") {
    set_details(
        "Provisions a dedicated database, copies the shared database into "
        "it while the application is in maintenance mode with all processes "
        "stopped, and rebinds the configuration to the new database. "
        "Maintenance mode and process scale are restored when the run "
        "ends, whatever the outcome.")
        .set_usage("pgshift migrate [OPTIONS] [APP]")
        .set_examples(
            "  pgshift migrate --app my-app\n"
            "  pgshift --config config/prod.yaml migrate my-app");

    add_flag("app", "a", "Application to migrate");
}

int MigrateCommand::run(cli::CommandContext& ctx) {
    std::string app = ctx.get_flag("app");
    if (app.empty()) {
        app = ctx.arg(0);
    }
    if (app.empty() || ctx.args().size() > 1) {
        std::cerr << "Error: expected exactly one application" << std::endl;
        print_usage();
        return cli::kUsageError;
    }

    Runtime runtime;
    try {
        runtime = bootstrap(ctx);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    saga::install_signal_handlers();

    migration::MigrationContext context;
    context.api = api::make_heroku_control_plane(*runtime.api);
    context.app = app;
    context.settings = *runtime.migration;
    context.transfer_service = api::make_pgbackups_factory(*runtime.api);

    saga::SagaExecutor executor(runtime.migration->rollback_policy());

    int exit_code = 0;
    try {
        auto report = executor.engage(migration::build_migration_plan(context));
        if (report.status == saga::RunStatus::aborted) {
            std::cout << report.abort_message << std::endl;
        } else {
            std::cout << "Migration of " << app << " complete." << std::endl;
        }
        if (report.unwind.failed > 0) {
            std::cerr << report.unwind.failed
                      << " rollback(s) did not succeed; inspect " << app
                      << " manually." << std::endl;
        }
    } catch (const std::exception& e) {
        PGSHIFT_LOG_FATAL << "Migration failed: " << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    log::Logger::shutdown();
    return exit_code;
}

}  // namespace pgshift::commands
