#pragma once
#include <string>

#include "pgshift/cli/command.hpp"

namespace pgshift::commands {

class ConfigCommand : public cli::Command {
public:
    ConfigCommand();
    int run(cli::CommandContext& ctx) override;

    static std::string generate_default_config();

private:
    int handle_init(const std::string& directory);
    int validate_config(const std::string& config_file);
    int dump_config(const std::string& config_file);
};

}  // namespace pgshift::commands
