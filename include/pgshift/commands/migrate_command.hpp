#pragma once
#include "pgshift/cli/command.hpp"

namespace pgshift::commands {

// Moves an application from its shared database to a dedicated one
class MigrateCommand : public cli::Command {
public:
    MigrateCommand();
    int run(cli::CommandContext& ctx) override;
};

}  // namespace pgshift::commands
