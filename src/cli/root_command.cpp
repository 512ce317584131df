#include "pgshift/cli/root_command.hpp"

#include "pgshift/commands/all_commands.hpp"
#include "pgshift/config/config.hpp"
#include "pgshift/version.hpp"

namespace pgshift::cli {

RootCommand::RootCommand()
    : Command("pgshift",
              "Move an application's data to a new hosted database") {
    set_details(
        "pgshift drives the control plane of a hosting platform through the "
        "steps of a database migration and rolls back what it can when a "
        "step fails.")
        .set_usage("pgshift [GLOBAL_OPTIONS] <COMMAND> [COMMAND_OPTIONS]")
        .set_examples(
            "  pgshift migrate --app my-app\n"
            "  pgshift transfer --app my-app RED\n"
            "  pgshift config --validate");

    add_flag("config", "c", "Global configuration file",
             config::DEFAULT_CONFIG_FILE);
    add_flag("log-level", "", "Log level (trace, debug, info, warn, error)");
    add_switch("version", "v", "Show version information");
}

int RootCommand::run(CommandContext& ctx) {
    if (ctx.get_bool_flag("version")) {
        print_version();
        return 0;
    }

    print_help();
    return ctx.args().empty() ? 0 : kUsageError;
}

std::shared_ptr<RootCommand> make_root_command() {
    auto root = std::make_shared<RootCommand>();
    root->add_command(std::make_shared<commands::MigrateCommand>());
    root->add_command(std::make_shared<commands::TransferCommand>());
    root->add_command(std::make_shared<commands::ConfigCommand>());
    return root;
}

}  // namespace pgshift::cli
