#include "pgshift/commands/runtime.hpp"

#include <filesystem>

#include "pgshift/log/logger.hpp"

namespace pgshift::commands {

Runtime load_runtime(const std::string& config_file, bool required) {
    auto& manager = config::ConfigManager::instance();
    manager.reset();

    Runtime runtime;
    runtime.api = manager.bind<api::ApiConfig>();
    runtime.migration = manager.bind<migration::MigrationConfig>();
    runtime.log = manager.bind<log::LogConfig>();

    if (required || std::filesystem::exists(config_file)) {
        manager.load_file(config_file);
    } else {
        manager.load_defaults();
    }

    runtime.api->apply_environment();
    return runtime;
}

Runtime bootstrap(const cli::CommandContext& ctx) {
    auto runtime = load_runtime(ctx.get_flag("config"),
                                ctx.is_user_provided("config"));

    if (ctx.is_user_provided("log-level")) {
        runtime.log->global_level =
            log::LogConfig::level_from_string(ctx.get_flag("log-level"));
    }
    log::Logger::init(*runtime.log);
    return runtime;
}

}  // namespace pgshift::commands
