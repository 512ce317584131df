#pragma once

#include <memory>

#include "pgshift/api/api_config.hpp"
#include "pgshift/cli/command.hpp"
#include "pgshift/log/log_config.hpp"
#include "pgshift/migration/migration_config.hpp"

namespace pgshift::commands {

// Configuration shared by every command
struct Runtime {
    std::shared_ptr<api::ApiConfig> api;
    std::shared_ptr<migration::MigrationConfig> migration;
    std::shared_ptr<log::LogConfig> log;
};

/// @brief Registers the configuration properties, loads the file named by
/// --config (the default file is optional), applies environment overrides
/// and starts logging.
/// @throws std::runtime_error if an explicitly named file cannot be loaded.
Runtime bootstrap(const cli::CommandContext& ctx);

// Loads configuration without starting logging
Runtime load_runtime(const std::string& config_file, bool required);

}  // namespace pgshift::commands
