#include "pgshift/commands/config_command.hpp"

#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "pgshift/api/api_config.hpp"
#include "pgshift/commands/runtime.hpp"
#include "pgshift/log/log_config.hpp"
#include "pgshift/migration/migration_config.hpp"

namespace pgshift::commands {

ConfigCommand::ConfigCommand()
    : cli::Command("config", "Configuration management tool") {
    set_details("Validate, inspect or create pgshift configuration.")
        .set_usage("pgshift [--config FILE] config [OPTIONS]")
        .set_examples(
            "  pgshift config --validate\n"
            "  pgshift --config config/prod.yaml config --dump\n"
            "  pgshift config --init /path/to/project");

    add_switch("validate", "", "Validate configuration file");
    add_switch("dump", "", "Dump effective configuration");
    add_flag("init", "", "Write a default configuration into a directory",
             ".");
}

int ConfigCommand::run(cli::CommandContext& ctx) {
    if (ctx.is_user_provided("init")) {
        return handle_init(ctx.get_flag("init"));
    }

    const std::string config_file = ctx.get_flag("config");

    if (ctx.get_bool_flag("validate")) {
        return validate_config(config_file);
    }

    if (ctx.get_bool_flag("dump")) {
        return dump_config(config_file);
    }

    print_help();
    return 0;
}

int ConfigCommand::handle_init(const std::string& directory) {
    try {
        std::filesystem::path config_dir =
            std::filesystem::path(directory) / "config";
        std::filesystem::create_directories(config_dir);

        std::filesystem::path config_file = config_dir / "pgshift.yaml";
        if (std::filesystem::exists(config_file)) {
            std::cerr << "Configuration file already exists: " << config_file
                      << std::endl;
            return 1;
        }

        std::ofstream file(config_file);
        if (!file.is_open()) {
            std::cerr << "Failed to create configuration file: " << config_file
                      << std::endl;
            return 1;
        }
        file << generate_default_config();

        std::cout << "Created default configuration: " << config_file
                  << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error initializing configuration: " << e.what()
                  << std::endl;
        return 1;
    }
}

std::string ConfigCommand::generate_default_config() {
    YAML::Node root;
    root["api"] = api::ApiConfig().to_yaml();
    root["migration"] = migration::MigrationConfig().to_yaml();
    root["log"] = log::LogConfig().to_yaml();

    std::stringstream ss;
    std::time_t now = std::time(nullptr);
    char mbstr[100];
    if (std::strftime(mbstr, sizeof(mbstr), "%Y-%m-%d %H:%M:%S",
                      std::localtime(&now))) {
        ss << "# Generated on: " << mbstr << "\n";
    }
    ss << "# pgshift configuration\n";
    ss << "# api.api_key may be left empty and supplied as HEROKU_API_KEY\n\n";
    YAML::Emitter emitter;
    emitter << root;
    ss << emitter.c_str() << "\n";
    return ss.str();
}

int ConfigCommand::validate_config(const std::string& file_path) {
    std::cout << "Validating config file: " << file_path << std::endl;
    try {
        load_runtime(file_path, true);
        std::cout << "Configuration is valid." << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Configuration validation failed: " << e.what()
                  << std::endl;
        return 1;
    }
}

int ConfigCommand::dump_config(const std::string& file_path) {
    try {
        auto runtime = load_runtime(file_path, false);

        YAML::Node root;
        root["api"] = runtime.api->to_yaml();
        if (!runtime.api->api_key.empty()) {
            root["api"]["api_key"] = "********";
        }
        root["migration"] = runtime.migration->to_yaml();
        root["log"] = runtime.log->to_yaml();

        YAML::Emitter emitter;
        emitter << root;
        std::cout << emitter.c_str() << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Failed to dump configuration: " << e.what() << std::endl;
        return 1;
    }
}

}  // namespace pgshift::commands
