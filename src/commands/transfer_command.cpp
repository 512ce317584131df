#include "pgshift/commands/transfer_command.hpp"

#include <iostream>

#include "pgshift/api/heroku_control_plane.hpp"
#include "pgshift/api/pgbackups_client.hpp"
#include "pgshift/commands/runtime.hpp"
#include "pgshift/log/logger.hpp"
#include "pgshift/transfer/transfer_poller.hpp"

namespace pgshift::commands {

TransferCommand::TransferCommand()
    : cli::Command("transfer", "Transfer one database into another") {
    set_details(
        "Copies DATABASE_FROM directly into DATABASE_TO without an "
        "intermediate dump. When only one database is given it is the "
        "destination and DATABASE_URL is the source. Databases are named by "
        "configuration variable or by color (e.g. RED).")
        .set_usage("pgshift transfer [OPTIONS] [DATABASE_FROM] DATABASE_TO")
        .set_examples(
            "  pgshift transfer --app my-app HEROKU_POSTGRESQL_RED\n"
            "  pgshift transfer -a my-app SHARED_DATABASE_URL RED");

    add_flag("app", "a", "Application owning the databases");
}

int TransferCommand::run(cli::CommandContext& ctx) {
    const std::string app = ctx.get_flag("app");
    std::string from = ctx.arg(0);
    std::string to = ctx.arg(1);
    if (to.empty()) {
        to = from;
        from = "DATABASE_URL";
    }
    if (app.empty() || to.empty() || ctx.args().size() > 2) {
        print_usage();
        return cli::kUsageError;
    }

    try {
        auto runtime = bootstrap(ctx);
        saga::install_signal_handlers();

        auto control_plane = api::make_heroku_control_plane(*runtime.api);
        auto vars = control_plane->get_config_vars(app);

        auto source = transfer::resolve_database(vars, from);
        if (!source) {
            std::cerr << "Error: " << from << " not found on " << app
                      << std::endl;
            return 1;
        }
        auto destination = transfer::resolve_database(vars, to);
        if (!destination) {
            std::cerr << "Error: " << to << " not found on " << app
                      << std::endl;
            return 1;
        }

        auto endpoint = vars.find(runtime.migration->transfer_endpoint_var);
        if (endpoint == vars.end()) {
            std::cerr << "Error: Please add the pgbackups add-on to " << app
                      << " first." << std::endl;
            return 1;
        }

        PGSHIFT_LOG_INFO << "Transferring " << source->first << " to "
                         << destination->first;

        auto service = api::make_pgbackups_factory(*runtime.api)(
            endpoint->second);
        auto started = service->create_transfer(
            source->second, source->first, destination->second,
            destination->first);

        transfer::TransferPoller poller(
            *service,
            std::chrono::milliseconds(runtime.migration->poll_interval_ms),
            saga::CancellationToken::global());
        auto finished = poller.wait(std::move(started));

        if (finished.failed()) {
            std::cerr << transfer::describe_failure(finished) << std::endl;
            return 1;
        }

        std::cout << "Transfer complete." << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

}  // namespace pgshift::commands
